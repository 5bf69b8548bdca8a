#pragma once

/*
===============================================================================
Spindle — Public API Entry Point
===============================================================================

Concurrent HTTP transfers driven through per-request lifecycle events.

  - core::message     request / response / headers / bodies
  - core::event       prioritized event bus (before, headers, complete, error)
  - core::transport   transfer engine, batch bookkeeping, multi-handle pool
  - core::transport::curl   libcurl backend

Most applications only need transport::CurlEngine, core::Transaction and
listeners registered on each request's emitter.
===============================================================================
*/

#include <spindle/core/error.hpp>
#include <spindle/core/event/emitter.hpp>
#include <spindle/core/event/event.hpp>
#include <spindle/core/event/kind.hpp>
#include <spindle/core/lifecycle.hpp>
#include <spindle/core/message/body.hpp>
#include <spindle/core/message/headers.hpp>
#include <spindle/core/message/request.hpp>
#include <spindle/core/message/response.hpp>
#include <spindle/core/transaction.hpp>
#include <spindle/core/transport/curl_engine.hpp>

#include <lcr/log/logger.hpp>
