#include <gtest/gtest.h>

#include "common/utilities_test.hpp"
#include "rag_api/routes.hpp"
#include "rag_api/server.hpp"

namespace rag_tests {

TEST(ServerTest, RejectsNonPositiveThreadCount) {
  EXPECT_THROW(rag_api::Server({"127.0.0.1", 3030, 0}), std::invalid_argument);
}

TEST(ServerTest, StopBeforeStartIsNoOp) {
  rag_api::Server server({"127.0.0.1", 3030, 2});

  EXPECT_FALSE(server.is_running());
  server.stop();
  EXPECT_FALSE(server.is_running());
  EXPECT_EQ(server.options().http_threads, 2);
}

class ServerRoutesTest : public ServiceTestBase {};

TEST_F(ServerRoutesTest, RegisteredRoutesValidate) {
  rag_api::Server server({"127.0.0.1", 3030, 1});
  rag_api::Routes routes(dataset_service_, query_service_, task_service_, resolver_);

  routes.register_routes(server);

  EXPECT_NO_THROW(server.app().validate());
}

}  // namespace rag_tests
