#include <gtest/gtest.h>

// This test ensures that every public header compiles cleanly when included
// together (common for downstream users).

#include "sqlcas/address/compound_key.hpp"
#include "sqlcas/address/resolver.hpp"
#include "sqlcas/address/url.hpp"
#include "sqlcas/bindings/http.hpp"
#include "sqlcas/cli/commands.hpp"
#include "sqlcas/cli/config.hpp"
#include "sqlcas/cli/options.hpp"
#include "sqlcas/core/errors.hpp"
#include "sqlcas/core/models.hpp"
#include "sqlcas/core/types.hpp"
#include "sqlcas/db/db.hpp"
#include "sqlcas/db/queries.hpp"
#include "sqlcas/db/schema.hpp"
#include "sqlcas/registry/connection_cache.hpp"
#include "sqlcas/registry/registry.hpp"
#include "sqlcas/registry/snapshot.hpp"
#include "sqlcas/server/http_server.hpp"
#include "sqlcas/storage/buffer.hpp"
#include "sqlcas/storage/hashing.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
