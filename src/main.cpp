#include "cdpflow/cli/app.hpp"

int main(int argc, char** argv) {
    cdpflow::cli::App app;
    return app.run(argc, argv);
}
