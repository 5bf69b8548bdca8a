#pragma once

#include "spindle/core/transport/curl/backend.hpp"
#include "spindle/core/transport/engine.hpp"

namespace spindle::core::transport {

// Production engine: libcurl multi interface behind transport::Engine
using CurlEngine = Engine<curl::Backend>;

} // namespace spindle::core::transport
