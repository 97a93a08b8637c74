/*
 * codegate - interactive code generation behind a validation gate
 *
 * Usage:
 *   ./codegate [--config config.json]
 *
 * Requires OPENAI_API_KEY (environment or .env) and python3 on PATH.
 */
#include <codegate/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = codegate::Application::instance();

    if (!app.init(argc, argv)) {
        // --help/--version or a fatal setup error
        int code = app.exit_code();
        app.shutdown();
        return code;
    }

    int result = app.run();
    app.shutdown();

    return result;
}
