#pragma once

#include "analyzers.hpp"
#include "config.hpp"
#include "continuity.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "job_manager.hpp"
#include "knowledge.hpp"
#include "log.hpp"
#include "patterns.hpp"
#include "report.hpp"
#include "scene.hpp"
#include "scene_parser.hpp"
#include "schedule.hpp"
#include "types.hpp"
#include "utils.hpp"
