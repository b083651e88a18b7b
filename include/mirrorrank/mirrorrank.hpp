#ifndef MIRRORRANK_HPP
#define MIRRORRANK_HPP

// Project version
#define MIRRORRANK_VERSION_MAJOR 0
#define MIRRORRANK_VERSION_MINOR 3
#define MIRRORRANK_VERSION_PATCH 0

// Binary version
#define MIRRORRANK_BINARY_CURRENT 0
#define MIRRORRANK_BINARY_REVISION 0
#define MIRRORRANK_BINARY_AGE 1

#include <mirrorrank/export.hpp>
#include <mirrorrank/enums.hpp>
#include <mirrorrank/errors.hpp>
#include <mirrorrank/context.hpp>
#include <mirrorrank/endpoint.hpp>
#include <mirrorrank/directory.hpp>
#include <mirrorrank/prober.hpp>
#include <mirrorrank/probe_coordinator.hpp>
#include <mirrorrank/filter.hpp>
#include <mirrorrank/ranker.hpp>
#include <mirrorrank/selection.hpp>
#include <mirrorrank/status.hpp>
#include <mirrorrank/render.hpp>
#include <mirrorrank/options.hpp>

#endif
