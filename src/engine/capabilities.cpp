#include "csv_toolbox/capabilities.hpp"
#include "csv_toolbox/separator_indexer.hpp"
#include <cstdlib>
#include <mutex>
#include <optional>
#include <string>

namespace ctb {

namespace {

std::mutex g_mu;
std::optional<Capabilities> g_caps;

bool env_flag(const char* name) {
  const char* v = std::getenv(name);
  return v && *v && std::string(v) != "0";
}

}

Capabilities EnvironmentCapabilities::get() {
  std::lock_guard<std::mutex> lk(g_mu);
  if (!g_caps) g_caps = detect();
  return *g_caps;
}

void EnvironmentCapabilities::reset() {
  std::lock_guard<std::mutex> lk(g_mu);
  g_caps.reset();
}

void EnvironmentCapabilities::set_for_testing(const Capabilities& caps) {
  std::lock_guard<std::mutex> lk(g_mu);
  g_caps = caps;
}

Capabilities EnvironmentCapabilities::detect() {
  Capabilities c;
  c.worker = !env_flag("CTB_DISABLE_WORKERS");
  c.transferable_streams = c.worker;
  c.compiled = !env_flag("CTB_DISABLE_COMPILED");
  if (!env_flag("CTB_DISABLE_ACCELERATED")) {
    std::future<bool> available = accelerated_is_available();
    c.accelerated = available.wait_for(kAvailabilityTimeout) == std::future_status::ready && available.get();
  }
  return c;
}

}
