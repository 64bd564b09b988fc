#include "app/shell_app.hpp"
#include "app/shell_options.hpp"

int main() {
    minsh::ShellApp app(minsh::ShellOptions::from_environment());
    return app.run();
}
