#include "app/BatchPlannerCli.hpp"

int main(int argc, char** argv) {
    return batchplanner::app::BatchPlannerCli::Run(argc, argv);
}
