#pragma once

namespace statusboard::net {

// Performs curl_global_init once per process; cleanup is registered with atexit.
bool EnsureCurlGlobalInit();

} // namespace statusboard::net
