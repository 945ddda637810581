#include <iostream>

int test_ledger();
int test_world();
int test_war();
int test_border_push();
int test_broadcast();
int test_tick_scheduler();
int test_snapshot();
int test_config();
int test_command_router();
int test_packet_codec();
int test_observer_server();

int main() {
    int fails = 0;
    fails += test_ledger();
    fails += test_world();
    fails += test_war();
    fails += test_border_push();
    fails += test_broadcast();
    fails += test_tick_scheduler();
    fails += test_snapshot();
    fails += test_config();
    fails += test_command_router();
    fails += test_packet_codec();
    fails += test_observer_server();

    if (fails == 0) {
        std::cout << "All tests passed\n";
        return 0;
    }
    std::cerr << fails << " tests failed\n";
    return 1;
}
