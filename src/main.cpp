#include "portwarden/cli/app.hpp"

int main(int argc, char** argv) {
    portwarden::cli::App app;
    return app.run(argc, argv);
}
