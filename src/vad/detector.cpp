#include "voice_service/vad/detector.hpp"

#include <utility>

#include "voice_service/vad/classifier.hpp"

namespace voice_service {
namespace vad {

OneShotDetector::OneShotDetector(std::shared_ptr<const ClassifierAdapter> classifier)
    : classifier_(std::move(classifier)) {}

Detection OneShotDetector::detect(const std::string& frame,
                                  int sample_rate,
                                  double threshold) const {
    Detection result;
    result.probability = classifier_->classify(frame, sample_rate);
    result.has_voice = result.probability >= threshold;
    return result;
}

}
}
