/**
 * @file evr/evr.hpp
 * @brief Umbrella header for the evr event handler combinators.
 */

#ifndef EVR_EVR_HPP_
#define EVR_EVR_HPP_

#include "evr/platform.hpp"
#include "evr/vocabulary.hpp"
#include "evr/log.hpp"
#include "evr/config.hpp"
#include "evr/handler.hpp"
#include "evr/adapt.hpp"
#include "evr/fault.hpp"
#include "evr/task_pool.hpp"
#include "evr/resilient.hpp"
#include "evr/parallel.hpp"
#include "evr/async.hpp"

#endif  // EVR_EVR_HPP_
