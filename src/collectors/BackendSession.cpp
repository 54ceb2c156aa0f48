#include "collectors/BackendSession.hpp"
#include <cstdio>

namespace gpuwatch::collectors {

BackendSession::BackendSession(ITelemetryBackend& backend)
    : backend_(backend), init_rc_(backend.init()) {}

BackendSession::~BackendSession() {
  std::string err;
  if (!close(err)) {
    std::fprintf(stderr, "gpuwatch: %s: %s\n", backend_.name(), err.c_str());
  }
}

std::string BackendSession::error() const {
  if (ok()) return {};
  return backend_.error_string(init_rc_);
}

bool BackendSession::close(std::string& err) {
  // A failed init leaves nothing to shut down.
  if (closed_ || !ok()) { closed_ = true; return true; }
  closed_ = true;
  int rc = backend_.shutdown();
  if (rc != ITelemetryBackend::kSuccess) {
    err = "unable to shut down " + std::string(backend_.name()) + ": " + backend_.error_string(rc);
    return false;
  }
  return true;
}

} // namespace gpuwatch::collectors
