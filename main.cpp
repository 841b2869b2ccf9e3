#include "Application.hpp"

int main(int argc, char* argv[]) { return run_application(argc, argv); }
