#include "app/VaultBreakdownApp.hpp"

int main(int argc, char** argv) {
    vaultbreakdown::app::VaultBreakdownApp app;
    return app.Run(argc, argv);
}
