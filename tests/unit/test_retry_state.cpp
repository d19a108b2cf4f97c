#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "source/retry_state.hpp"

using namespace std;

TEST_CASE("backoff doubles up to the cap")
{
    RetryPolicy policy;
    policy.max_attempts = 10;
    RetryState retry(policy);

    vector<long long> delays;
    for (int i = 0; i < 6; i++)
        delays.push_back(retry.recordFailure().count());

    CHECK(delays == vector<long long>{200, 400, 800, 1600, 3000, 3000});
}

TEST_CASE("budget is exhausted after max_attempts + 1 failures")
{
    RetryPolicy policy;
    policy.max_attempts = 3;
    RetryState retry(policy);

    for (int i = 0; i < 3; i++)
    {
        retry.recordFailure();
        CHECK_FALSE(retry.exhausted());
    }
    retry.recordFailure();
    CHECK(retry.exhausted());
    CHECK(retry.attempts() == 4);

    retry.reset();
    CHECK_FALSE(retry.exhausted());
    CHECK(retry.recordFailure().count() == 200);
}

TEST_CASE("zero attempts gives up on the first failure")
{
    RetryPolicy policy;
    policy.max_attempts = 0;
    RetryState retry(policy);
    retry.recordFailure();
    CHECK(retry.exhausted());
}
