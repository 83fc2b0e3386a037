#include "rro/signer.hpp"
#include "rro/platform.hpp"

namespace rro {

SignResult ApkSignerTool::sign(const std::string& input, const std::string& output) {
    SignResult result;

    if (apksigner_.empty()) {
        result.error = "apksigner not configured";
        return result;
    }
    if (key_.keystore.empty()) {
        result.error = "signing keystore not configured";
        return result;
    }

    std::vector<std::string> args = {"sign", "--ks", key_.keystore};
    if (!key_.alias.empty()) {
        args.push_back("--ks-key-alias");
        args.push_back(key_.alias);
    }
    args.push_back("--ks-pass");
    args.push_back("pass:" + key_.password);
    args.push_back("--out");
    args.push_back(output);
    args.push_back(input);

    auto run = tools_.run(apksigner_, args);
    if (!run.ok) {
        result.error = run.error;
        return result;
    }

    if (run.exit_code != 0) {
        result.error = "apksigner exited with " + std::to_string(run.exit_code);
        for (const auto& line : run.stderr_lines) {
            result.error += "\n" + line;
        }
        return result;
    }

    if (!is_regular_file(output)) {
        result.error = "apksigner produced no output";
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace rro
