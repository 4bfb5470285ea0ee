#pragma once
#include <chrono>

namespace ctb {

struct Capabilities {
  bool worker = false;
  bool transferable_streams = false;
  bool compiled = false;
  bool accelerated = false;
};

// Process-wide capability cache. Detection runs once, on first use.
// CTB_DISABLE_WORKERS / CTB_DISABLE_COMPILED / CTB_DISABLE_ACCELERATED turn
// individual capabilities off.
class EnvironmentCapabilities {
public:
  static constexpr std::chrono::milliseconds kAvailabilityTimeout{3000};

  static Capabilities get();
  static void reset();
  static void set_for_testing(const Capabilities& caps);

private:
  static Capabilities detect();
};

}
