#ifndef NOCTURNA_BACKEND_GATEWAY_IMEASUREMENTGATEWAY_H
#define NOCTURNA_BACKEND_GATEWAY_IMEASUREMENTGATEWAY_H

#include <optional>
#include <string>
#include "common/DataTypes.h"
#include "common/YearlySeries.h"

namespace nocturna::backend::gateway {

using nocturna::backend::common::Measurement;
using nocturna::backend::common::YearlySeries;

// Measurement source seam. Implementations own their transport (file, HTTP,
// database) and must tolerate concurrent fetchPoint() calls.
class IMeasurementGateway {
public:
	virtual ~IMeasurementGateway() = default;

	// nullopt when the source has no reading at the location.
	// Throws GatewayUnavailableError when the source itself cannot be reached.
	virtual std::optional<Measurement> fetchPoint(double lat, double lng) = 0;

	// Years in [startYear, endYear] that the source knows about, ascending.
	virtual YearlySeries fetchSeries(double lat, double lng, int startYear, int endYear) = 0;

	virtual std::string getGatewayID() const = 0;
};

} // namespace nocturna::backend::gateway

#endif // NOCTURNA_BACKEND_GATEWAY_IMEASUREMENTGATEWAY_H
