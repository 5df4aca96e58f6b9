#include "utils/spinner.hpp"

#include <chrono>
#include <utility>

namespace shellpilot::utils {
namespace {

constexpr const char* kFrames[] = {"|", "/", "-", "\\"};
constexpr std::size_t kFrameCount = sizeof(kFrames) / sizeof(kFrames[0]);

}  // namespace

Spinner::Spinner(std::ostream& out, bool enabled)
    : out_(out)
    , enabled_(enabled) {}

Spinner::~Spinner() {
    Stop();
}

void Spinner::Start(std::string message) {
    if (!enabled_ || running_.exchange(true)) {
        return;
    }
    message_ = std::move(message);
    worker_ = std::thread([this]() { RunLoop(); });
}

void Spinner::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    out_ << "\r" << std::string(message_.size() + 12, ' ') << "\r" << std::flush;
}

void Spinner::RunLoop() {
    std::size_t frame = 0;
    while (running_.load()) {
        out_ << "\r  " << kFrames[frame % kFrameCount] << " " << message_ << "...   " << std::flush;
        ++frame;
        std::this_thread::sleep_for(std::chrono::milliseconds(80));
    }
}

}  // namespace shellpilot::utils
