/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <predcomb/util/global_lifetimes.hpp>
#include <predcomb/log/log.hpp>

namespace predcomb {

void shutdown_globals() {
    PREDCOMB_DEBUG(log::root(), "Shutting down globals");
    log::Loggers::instance().flush_all();
    log::Loggers::destroy_instance();
}

} //namespace predcomb
