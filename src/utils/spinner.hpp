#pragma once

#include <atomic>
#include <ostream>
#include <string>
#include <thread>
#include <utility>

namespace shellpilot::utils {

// Cosmetic progress indicator drawn on its own thread. It carries no data;
// Stop() joins the thread and clears the line.
class Spinner {
public:
    Spinner(std::ostream& out, bool enabled);
    ~Spinner();

    Spinner(const Spinner&) = delete;
    Spinner& operator=(const Spinner&) = delete;

    void Start(std::string message);
    void Stop();
    bool Running() const { return running_.load(); }

private:
    void RunLoop();

    std::ostream& out_;
    bool enabled_ = true;
    std::string message_;
    std::atomic<bool> running_{false};
    std::thread worker_;
};

// Keeps the spinner running for the lifetime of the guard.
class ScopedSpinner {
public:
    ScopedSpinner(Spinner& spinner, std::string message)
        : spinner_(spinner) {
        spinner_.Start(std::move(message));
    }
    ~ScopedSpinner() { spinner_.Stop(); }

    ScopedSpinner(const ScopedSpinner&) = delete;
    ScopedSpinner& operator=(const ScopedSpinner&) = delete;

private:
    Spinner& spinner_;
};

}  // namespace shellpilot::utils
