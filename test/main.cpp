#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "concurrent/semaphore.h"
#include "concurrent/thread.h"
#include "concurrent/channel.h"
#include "resource.h"
#include "philosopher.h"
#include "table.h"
#include "protocols/resource_hierarchy.h"
#include "protocols/arbitrator.h"
#include "protocols/bounded_occupancy.h"
#include "protocols/chandy_misra.h"
#include "protocols/dinner.h"
