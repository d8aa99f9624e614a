#include "app/TreeShaperApp.hpp"

int main(int argc, char** argv) {
    treeshaper::app::LaunchOptions options;
    if (!treeshaper::app::TreeShaperApp::ParseArguments(argc, argv, options)) {
        return 2;
    }
    treeshaper::app::TreeShaperApp app;
    return app.Run(options);
}
