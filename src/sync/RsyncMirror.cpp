#include "sync/RsyncMirror.hpp"
#include "util/process.hpp"
#include "logging/LogRegistry.hpp"

using namespace ms::sync;
using namespace ms::util;
using namespace ms::logging;

// rsync copies the contents of a directory only when the source ends with a separator
static std::string asDirArg(const std::filesystem::path& p) {
    auto s = p.string();
    if (s.empty() || s.back() != '/') s.push_back('/');
    return s;
}

RsyncMirror::RsyncMirror(std::string executable, std::vector<std::string> extraArgs)
    : executable_(std::move(executable)), extraArgs_(std::move(extraArgs)) {}

std::vector<std::string> RsyncMirror::buildArgs(const MirrorRequest& req) const {
    std::vector<std::string> argv{executable_, "--archive"};
    if (req.deleteExtraneous) argv.emplace_back("--delete");
    argv.insert(argv.end(), {"--no-perms", "--no-owner", "--no-group", "--omit-dir-times"});
    if (req.checksum) argv.emplace_back("--checksum");
    if (req.dryRun) argv.emplace_back("--dry-run");
    argv.insert(argv.end(), extraArgs_.begin(), extraArgs_.end());

    for (const auto& rule : req.rules.rules())
        argv.push_back((rule.isInclude() ? "--include=" : "--exclude=") + rule.pattern);

    argv.push_back(asDirArg(req.source));
    argv.push_back(asDirArg(req.destination));
    return argv;
}

MirrorResult RsyncMirror::run(const MirrorRequest& req) {
    const auto argv = buildArgs(req);
    LogRegistry::sync()->debug("[RsyncMirror] {}: {}", req.submodule, quoteArgs(argv));

    const auto res = runProcess(argv);
    if (!res.ok())
        LogRegistry::sync()->debug("[RsyncMirror] {} exited with {}", req.submodule, res.exit_code);

    return {res.exit_code, res.stderr_text, res.stdout_text};
}
