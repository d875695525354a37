#include "app/GlycemicGuardApp.hpp"

int main(int argc, char** argv) {
    glycemicguard::app::GlycemicGuardApp app;
    return app.Run(argc, argv);
}
