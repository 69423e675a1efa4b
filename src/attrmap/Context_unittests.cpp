#include "attrmap/Context.hpp"

#include "doctest/doctest.h"

#include <thread>

namespace attrmap {

TEST_CASE("Context cancellation") {
    SUBCASE("fresh context is live") {
        Context context;
        CHECK_EQ(context.err(), "");
        CHECK_FALSE(context.isDone());
        CHECK_FALSE(context.options().unhandledNullAsEmpty);
        CHECK_FALSE(context.options().unhandledUnknownAsEmpty);
        CHECK_EQ(context.options().maxDepth, 64);
    }
    SUBCASE("cancel") {
        Context context;
        context.cancel();
        CHECK(context.isDone());
        CHECK_EQ(context.err(), "context canceled");
    }
    SUBCASE("copies share cancellation") {
        Context context;
        Context copy(context);
        std::thread canceller([&copy] { copy.cancel(); });
        canceller.join();
        CHECK_EQ(context.err(), "context canceled");
    }
    SUBCASE("passed deadline") {
        Context context;
        context.setDeadline(std::chrono::steady_clock::now() - std::chrono::seconds(1));
        CHECK_EQ(context.err(), "context deadline exceeded");
    }
    SUBCASE("future deadline") {
        Context context;
        context.setTimeout(std::chrono::hours(1));
        CHECK_FALSE(context.isDone());
    }
    SUBCASE("cancellation wins over deadline") {
        Context context;
        context.setDeadline(std::chrono::steady_clock::now() - std::chrono::seconds(1));
        context.cancel();
        CHECK_EQ(context.err(), "context canceled");
    }
}

TEST_CASE("Context options") {
    Options options;
    options.unhandledNullAsEmpty = true;
    options.maxDepth = 3;
    Context context(options);
    CHECK(context.options().unhandledNullAsEmpty);
    CHECK_FALSE(context.options().unhandledUnknownAsEmpty);
    CHECK_EQ(context.options().maxDepth, 3);
    context.options().unhandledUnknownAsEmpty = true;
    CHECK(context.options().unhandledUnknownAsEmpty);
}

} // namespace attrmap
