#pragma once

namespace resumable::detail {

// curl_global_init exactly once per process; cleanup is registered with atexit.
void ensureCurlInitialized();

} // namespace resumable::detail
