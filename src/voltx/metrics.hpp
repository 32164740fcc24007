//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_METRICS_HPP
#define VOLTX_METRICS_HPP

#include <batteries/metrics/metric_collectors.hpp>
#include <batteries/metrics/metric_registry.hpp>

namespace voltx {

using ::batt::CountMetric;
using ::batt::global_metric_registry;
using ::batt::MetricRegistry;

}  // namespace voltx

#endif  // VOLTX_METRICS_HPP
