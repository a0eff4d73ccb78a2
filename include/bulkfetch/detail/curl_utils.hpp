#pragma once

namespace bulkfetch::detail {

// Runs curl_global_init once per process and registers the matching cleanup.
void ensureCurlInitialized();

} // namespace bulkfetch::detail
