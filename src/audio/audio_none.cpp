#include <memory>
#include <stdexcept>

#include "audio/audio_backend.hpp"

namespace agent_notifier::audio {
namespace {

class NoneAudioBackend final : public AudioBackend {
 public:
  std::unique_ptr<AudioOutput> open_default_output() override {
    throw std::runtime_error("no audio output backend compiled in");
  }

  Samples decode(const std::vector<std::uint8_t>& bytes) const override { return decode_wav(bytes); }
};

}  // namespace

std::unique_ptr<AudioBackend> make_none_backend() { return std::make_unique<NoneAudioBackend>(); }

}  // namespace agent_notifier::audio
