#pragma once

/// Umbrella header for the geodata C++ client library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "query.hpp"
#include "codec.hpp"
#include "normalizer.hpp"
#include "handler.hpp"
#include "registry.hpp"
#include "request_builder.hpp"
#include "worker_pool.hpp"
#include "dispatcher.hpp"
#include "pagination.hpp"
#include "client.hpp"
#include "auth/signer.hpp"
#include "transport/transport.hpp"
#include "transport/http_transport.hpp"
