/*
* Copyright 2023 Man Group Operations Ltd.
* NO WARRANTY, EXPRESSED OR IMPLIED
*/

#pragma once

namespace predcomb {

// Releases the process-wide singletons, must be the last call into the library.
void shutdown_globals();

} //namespace predcomb
