#pragma once

#include "engine/events.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace rehash {

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

// Single self-overwriting line on the log stream.
class ConsoleProgressSink final : public IProgress {
  public:
    explicit ConsoleProgressSink(std::string label) : label_(std::move(label)) {}

    void OnProgress(const ProgressEvent& e) override;

    // Ends the line after the last update.
    void Finish();

  private:
    std::string label_;
};

} // namespace rehash
