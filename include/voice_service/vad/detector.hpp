#pragma once

#include <memory>
#include <string>

namespace voice_service {
namespace vad {

class ClassifierAdapter;

struct Detection {
    bool has_voice = false;
    float probability = 0.0f;
};

// Single-frame classification with no history.
class OneShotDetector {
public:
    explicit OneShotDetector(std::shared_ptr<const ClassifierAdapter> classifier);

    Detection detect(const std::string& frame, int sample_rate, double threshold) const;

private:
    std::shared_ptr<const ClassifierAdapter> classifier_;
};

}
}
