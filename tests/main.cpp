#include <iostream>

int test_args();
int test_jobs();
int test_log_sinks();
int test_cvars();
int test_json_writer();
int test_catalog_file();
int test_trade_config();
int test_profit_calculator();
int test_availability();
int test_legality();
int test_candidate_graph();
int test_candidate_graph_parallel();
int test_route_optimizer();
int test_result_shaper();
int test_route_planner();

int main() {
  int fails = 0;

  fails += test_args();
  fails += test_jobs();
  fails += test_log_sinks();
  fails += test_cvars();
  fails += test_json_writer();
  fails += test_catalog_file();
  fails += test_trade_config();
  fails += test_profit_calculator();
  fails += test_availability();
  fails += test_legality();
  fails += test_candidate_graph();
  fails += test_candidate_graph_parallel();
  fails += test_route_optimizer();
  fails += test_result_shaper();
  fails += test_route_planner();

  if (fails == 0) {
    std::cout << "[tradelane_tests] ALL PASS\n";
    return 0;
  }

  std::cerr << "[tradelane_tests] FAILS=" << fails << "\n";
  return 1;
}
