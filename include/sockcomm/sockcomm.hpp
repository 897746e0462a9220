#pragma once

/**
 * @file
 * @brief Umbrella include for the complete sockcomm public API.
 */

#include "sockcomm/addr/codec.hpp"
#include "sockcomm/addr/resolver.hpp"
#include "sockcomm/comm/channel.hpp"
#include "sockcomm/comm/local_channel.hpp"
#include "sockcomm/core/error.hpp"
#include "sockcomm/core/log.hpp"
#include "sockcomm/core/result.hpp"
#include "sockcomm/core/unique_fd.hpp"
#include "sockcomm/socket/factory.hpp"
#include "sockcomm/socket/parameters.hpp"
#include "sockcomm/socket/shim.hpp"
#include "sockcomm/socket/socket_handle.hpp"
#include "sockcomm/socket/tcp.hpp"
#include "sockcomm/socket/udp.hpp"
