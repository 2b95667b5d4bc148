#pragma once
#include <ripple/version.hpp>

#include <ripple/core/log.hpp>
#include <ripple/core/config.hpp>
#include <ripple/core/event.hpp>
#include <ripple/core/disposable.hpp>
#include <ripple/core/dispose_bag.hpp>
#include <ripple/core/pipeline.hpp>
#include <ripple/core/scheduler.hpp>
#include <ripple/core/thread_pool.hpp>
#include <ripple/core/observer.hpp>
#include <ripple/core/observable.hpp>
#include <ripple/core/binder.hpp>

#include <ripple/subjects/publish_subject.hpp>
#include <ripple/subjects/replay_subject.hpp>
#include <ripple/subjects/behavior_subject.hpp>
#include <ripple/subjects/async_subject.hpp>
#include <ripple/subjects/control_property.hpp>
#include <ripple/subjects/variable.hpp>

#include <ripple/ops/sources.hpp>
#include <ripple/ops/observe_on.hpp>
#include <ripple/ops/subscribe_on.hpp>
