#include "test_main.hh"

#include <gtest/gtest.h>

#include <cstdlib>
#include <cstring>

#include <common/log.hh>
#include <common/pool.hh>
#include <common/threads.hh>

bool tests_verbose = false;

// every test starts out with the parsers' scratch buffers returned
class pool_balance_listener : public testing::EmptyTestEventListener
{
public:
    void OnTestEnd(const testing::TestInfo &test_info) override
    {
        EXPECT_EQ(0, pool::array_pool<char>::shared().outstanding()) << test_info.name();
    }
};

int main(int argc, char **argv)
{
    logging::preinitialize();

    // writing console colors within test case output breaks IDE integration
    logging::enable_color_codes = false;

    for (int i = 1; i < argc; ++i) {
        // parse "-threads 1"
        if (!strcmp("-threads", argv[i]) || !strcmp("--threads", argv[i])) {
            if (!(i + 1 < argc)) {
                logging::print("--threads requires an argument\n");
                exit(1);
            }
            configureTBB(atoi(argv[i + 1]));
            continue;
        }
        // parse "-verbose"
        if (!strcmp("-verbose", argv[i]) || !strcmp("--verbose", argv[i])) {
            tests_verbose = true;
            logging::mask |= logging::flag::VERBOSE;
            continue;
        }
    }

    testing::InitGoogleTest(&argc, argv);

    testing::TestEventListeners &listeners = testing::UnitTest::GetInstance()->listeners();
    listeners.Append(new pool_balance_listener());

    return RUN_ALL_TESTS();
}
