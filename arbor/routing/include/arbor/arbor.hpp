#pragma once

// IWYU pragma: begin_exports
#include "arbor/log.hpp"
#include "arbor/node-tree.hpp"
#include "arbor/node.hpp"
#include "arbor/router-config.hpp"
#include "arbor/router.hpp"
#include "arbor/routing-error.hpp"
#include "arbor/segment-cursor.hpp"
// IWYU pragma: end_exports
