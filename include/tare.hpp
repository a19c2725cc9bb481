#pragma once

#include "tare/analysis.hpp"
#include "tare/cli.hpp"
#include "tare/collector.hpp"
#include "tare/config.hpp"
#include "tare/errors.hpp"
#include "tare/format.hpp"
#include "tare/planner.hpp"
#include "tare/registry.hpp"
#include "tare/render.hpp"
#include "tare/runner.hpp"
#include "tare/sandbox.hpp"
#include "tare/serialize.hpp"
#include "tare/storage.hpp"
#include "tare/types.hpp"
#include "tare/utils.hpp"
#include "tare/weight.hpp"
