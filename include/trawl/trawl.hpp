#pragma once

// Public entry point: the adaptive pool, the crawler built on it and the
// stores and helpers they use.

#include "autoscaling/autoscaled_pool.hpp"
#include "autoscaling/snapshotter.hpp"
#include "autoscaling/system_status.hpp"
#include "core/async/interval.hpp"
#include "core/async/timeout.hpp"
#include "core/config/config.hpp"
#include "core/errors/errors.hpp"
#include "core/logger/logger.hpp"
#include "engine/crawler/crawler.hpp"
#include "engine/handlers/page_handler.hpp"
#include "engine/router/router.hpp"
#include "engine/statistics/statistics.hpp"
#include "network/http/beast_client.hpp"
#include "storage/dataset.hpp"
#include "storage/request_list.hpp"
#include "storage/request_queue.hpp"
#include "utils/url/url.hpp"
