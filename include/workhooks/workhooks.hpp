#ifndef WORKHOOKS_HPP
#define WORKHOOKS_HPP

// Main header that includes everything

#include <workhooks/audit.hpp>
#include <workhooks/change_detector.hpp>
#include <workhooks/dispatcher.hpp>
#include <workhooks/errors.hpp>
#include <workhooks/event_emitter.hpp>
#include <workhooks/executor.hpp>
#include <workhooks/hook_registry.hpp>
#include <workhooks/logging.hpp>
#include <workhooks/metrics.hpp>
#include <workhooks/options.hpp>
#include <workhooks/pipeline.hpp>
#include <workhooks/snapshot.hpp>
#include <workhooks/store.hpp>
#include <workhooks/types.hpp>
#include <workhooks/version.hpp>

#endif // WORKHOOKS_HPP
