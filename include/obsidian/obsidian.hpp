
#pragma once

#include "errors.hpp"
#include "nullable.hpp"

#include "persistent-map.hpp"
#include "persistent-set.hpp"
#include "persistent-vector.hpp"
#include "persistent-stack.hpp"
#include "persistent-queue.hpp"
#include "sorted-map.hpp"
#include "sorted-set.hpp"

#include "concepts.hpp"
#include "collections.hpp"
#include "format.hpp"
