#include "TransportFactory.h"
#include "sensors/sick/SickTcpTransport.h"

std::unique_ptr<ITransport> create_transport(const SensorConfig& cfg) {
    if (cfg.type == "sick_tim_tcp") {
        return std::make_unique<SickTcpTransport>();
    }
    return nullptr;
}
