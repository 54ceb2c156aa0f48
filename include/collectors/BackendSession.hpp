#pragma once
#include <string>
#include "collectors/ITelemetryBackend.hpp"

namespace gpuwatch::collectors {

// Owns the init/shutdown pair of a telemetry backend. The library is
// initialized in the constructor and shut down exactly once, either by an
// explicit close() or by the destructor.
class BackendSession {
public:
  explicit BackendSession(ITelemetryBackend& backend);
  ~BackendSession();
  BackendSession(const BackendSession&) = delete;
  BackendSession& operator=(const BackendSession&) = delete;

  [[nodiscard]] bool ok() const { return init_rc_ == ITelemetryBackend::kSuccess; }
  // Library text for the init failure; empty when ok().
  [[nodiscard]] std::string error() const;

  // Shut the library down now. Returns false (with err) if shutdown failed.
  // Subsequent calls are no-ops that return true.
  [[nodiscard]] bool close(std::string& err);

private:
  ITelemetryBackend& backend_;
  int init_rc_;
  bool closed_{false};
};

} // namespace gpuwatch::collectors
