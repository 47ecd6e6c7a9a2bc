#pragma once

#include <memory>
#include <string>

namespace voice_service {
namespace speech {

class ServiceClient;

class SpeechToText {
public:
    virtual ~SpeechToText() = default;

    // format names the encoding of audio ("pcm" is 16-bit little-endian).
    virtual std::string transcribe(const std::string& audio,
                                   const std::string& format,
                                   const std::string& language) = 0;
};

class RemoteSpeechToText : public SpeechToText {
public:
    explicit RemoteSpeechToText(std::shared_ptr<ServiceClient> client);

    std::string transcribe(const std::string& audio,
                           const std::string& format,
                           const std::string& language) override;

private:
    std::shared_ptr<ServiceClient> client_;
};

}
}
