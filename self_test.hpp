#pragma once

// Runs every module's test(), throws std::runtime_error on the first failure.
void run_all_tests();
