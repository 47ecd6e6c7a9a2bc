#pragma once

#include <nlohmann/json.hpp>

#include "voice_service/server/request.hpp"

namespace voice_service {

namespace vad {
class OneShotDetector;
class SessionRegistry;
}

namespace server {

struct VadDefaults {
    int sample_rate = 16000;
    double threshold = 0.5;
    double threshold_low = 0.15;
};

// JSON bindings of the VAD operations. Engine errors propagate unchanged so
// the server can map them to a status.
class VadRoutes {
public:
    VadRoutes(vad::OneShotDetector& detector,
              vad::SessionRegistry& sessions,
              VadDefaults defaults);

    RestResponse detect(const nlohmann::json& body) const;
    RestResponse start(const nlohmann::json& body) const;
    RestResponse process(const nlohmann::json& body) const;
    RestResponse end(const nlohmann::json& body) const;

private:
    vad::OneShotDetector& detector_;
    vad::SessionRegistry& sessions_;
    VadDefaults defaults_;
};

}
}
