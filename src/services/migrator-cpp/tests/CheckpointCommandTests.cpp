#include "ArchiveManager.hpp"
#include "CheckpointTool.hpp"
#include "FakeHosts.hpp"
#include "LivenessProbe.hpp"
#include "TransferService.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {
int CheckToolCommands() {
    const CheckpointTool tool;

    const std::string single = Join(tool.BuildCheckpointCommand("c1", "/srv/c1/images", false, std::nullopt));
    if (single != "sudo runc --id c1 checkpoint --image-path /srv/c1/images") {
        return Fail("Unexpected checkpoint command: " + single);
    }

    const std::string preDump = Join(tool.BuildCheckpointCommand("c1", "/srv/c1/images/0", true, std::nullopt));
    if (preDump != "sudo runc --id c1 checkpoint --image-path /srv/c1/images/0 --pre-dump") {
        return Fail("Unexpected pre-dump command: " + preDump);
    }

    const std::string delta = Join(tool.BuildCheckpointCommand("c1", "/srv/c1/images/1", false, std::string("/srv/c1/images/0")));
    if (delta != "sudo runc --id c1 checkpoint --image-path /srv/c1/images/1 --prev-images-dir /srv/c1/images/0") {
        return Fail("Unexpected final checkpoint command: " + delta);
    }

    const std::string restore = Join(tool.BuildRestoreCommand("c1", "/dst/c1/images", "/dst/c1/config.json", "/dst/c1/runtime.json"));
    if (restore != "sudo runc --id c1 restore --image-path /dst/c1/images --config-file /dst/c1/config.json --runtime-file /dst/c1/runtime.json") {
        return Fail("Unexpected restore command: " + restore);
    }

    const CheckpointTool plain("crun", false);
    const std::string noSudo = Join(plain.BuildCheckpointCommand("c9", "/x", false, std::nullopt));
    if (noSudo != "crun --id c9 checkpoint --image-path /x") {
        return Fail("Unexpected command without sudo: " + noSudo);
    }

    return 0;
}

int CheckToolExecution() {
    auto log = std::make_shared<EventLog>();
    FakeExecutor executor("src", log);
    const CheckpointTool tool;

    std::string error;
    if (tool.Checkpoint(executor, "", "/x", false, std::nullopt, error)) {
        return Fail("Checkpoint should fail for an empty container id.");
    }
    if (!log->Events().empty()) {
        return Fail("Executor invoked for invalid checkpoint input.");
    }

    executor.SetHandler([](const std::vector<std::string>&) { return Exited(1, "criu failed: no such process"); });
    error.clear();
    if (tool.Checkpoint(executor, "c1", "/x", false, std::nullopt, error)) {
        return Fail("Checkpoint should fail when the tool exits non-zero.");
    }
    if (error.find("criu failed") == std::string::npos) {
        return Fail("Checkpoint error lost the tool output: " + error);
    }

    executor.FailStart("exec sudo: No such file or directory");
    error.clear();
    if (tool.StartRestore(executor, "c1", "/x", "/c.json", "/r.json", error)) {
        return Fail("StartRestore should fail when the process cannot launch.");
    }
    if (error.find("No such file") == std::string::npos) {
        return Fail("StartRestore lost the launch error: " + error);
    }

    return 0;
}

int CheckArchiveCommands() {
    const ArchiveManager archive;

    const std::string compress = Join(archive.BuildCompressCommand("/srv/c1/images", "/srv/c1/dump.tar.gz"));
    if (compress != "sudo tar -czf /srv/c1/dump.tar.gz -C /srv/c1/images/ .") {
        return Fail("Unexpected compress command: " + compress);
    }

    const std::string decompress = Join(archive.BuildDecompressCommand("/dst/c1/images/dump.tar.gz", "/dst/c1/images"));
    if (decompress != "sudo tar -C /dst/c1/images -xvzf /dst/c1/images/dump.tar.gz") {
        return Fail("Unexpected decompress command: " + decompress);
    }

    auto log = std::make_shared<EventLog>();
    FakeExecutor executor("dst", log);
    std::string error;
    if (archive.Decompress(executor, "", "/dst", error)) {
        return Fail("Decompress should fail for an empty archive path.");
    }
    if (log->Count("run") != 0) {
        return Fail("Executor invoked for invalid decompress input.");
    }

    return 0;
}

int CheckLivenessProbe() {
    auto log = std::make_shared<EventLog>();
    FakeExecutor executor("dst", log);

    const LivenessProbe present("/var/run/opencontainer/containers/", true);
    const std::string probe = Join(present.BuildProbeCommand("c1"));
    if (probe != "stat /var/run/opencontainer/containers/c1") {
        return Fail("Unexpected probe command: " + probe);
    }

    executor.SetHandler([](const std::vector<std::string>&) { return Succeeded(); });
    if (!present.IsRunning(executor, "c1")) {
        return Fail("Present marker should mean running.");
    }

    executor.SetHandler([](const std::vector<std::string>&) { return Exited(1, "No such file or directory"); });
    if (present.IsRunning(executor, "c1")) {
        return Fail("Missing marker should mean not running.");
    }

    const LivenessProbe absent("/run/runc", false);
    if (!absent.IsRunning(executor, "c1")) {
        return Fail("Inverted polarity should treat a missing marker as running.");
    }

    executor.SetHandler([](const std::vector<std::string>&) { return Exited(255, "ssh: connect to host dst"); });
    if (absent.IsRunning(executor, "c1") || present.IsRunning(executor, "c1")) {
        return Fail("An unreachable host must never look running.");
    }

    return 0;
}

int CheckTransferCommands() {
    ResourceLocator localSrc;
    localSrc.path = "/srv/c1/dump.tar.gz";
    ResourceLocator localDst;
    localDst.path = "/dst/c1/images";

    const std::string local = Join(ScpTransfer::BuildCopyCommand(localSrc, localDst));
    if (local != "cp -r /srv/c1/dump.tar.gz /dst/c1/images") {
        return Fail("Unexpected local copy command: " + local);
    }

    ResourceLocator remoteDst;
    remoteDst.user = "root";
    remoteDst.host = "node2";
    remoteDst.port = 2222;
    remoteDst.path = "/dst/c1/images";
    const std::string push = Join(ScpTransfer::BuildCopyCommand(localSrc, remoteDst));
    if (push != "scp -r -o BatchMode=yes -o ConnectTimeout=10 -o ServerAliveInterval=5 -o ServerAliveCountMax=3 /srv/c1/dump.tar.gz scp://root@node2:2222//dst/c1/images") {
        return Fail("Unexpected scp command: " + push);
    }

    ResourceLocator remoteSrc;
    remoteSrc.host = "node1";
    remoteSrc.path = "/srv/c1/dump.tar.gz";
    const std::string relay = Join(ScpTransfer::BuildCopyCommand(remoteSrc, remoteDst));
    if (relay != "scp -r -o BatchMode=yes -o ConnectTimeout=10 -o ServerAliveInterval=5 -o ServerAliveCountMax=3 -3 node1:/srv/c1/dump.tar.gz scp://root@node2:2222//dst/c1/images") {
        return Fail("Unexpected remote-to-remote scp command: " + relay);
    }

    // Each end keeps its own port.
    ResourceLocator portedSrc;
    portedSrc.host = "node1";
    portedSrc.port = 2200;
    portedSrc.path = "/srv/c1/dump.tar.gz";
    ResourceLocator defaultDst;
    defaultDst.host = "node2";
    defaultDst.path = "/dst/c1/images";
    const std::string mixed = Join(ScpTransfer::BuildCopyCommand(portedSrc, defaultDst));
    if (mixed != "scp -r -o BatchMode=yes -o ConnectTimeout=10 -o ServerAliveInterval=5 -o ServerAliveCountMax=3 -3 scp://node1:2200//srv/c1/dump.tar.gz node2:/dst/c1/images") {
        return Fail("Source port leaked onto the destination: " + mixed);
    }
    if (mixed.find("-P") != std::string::npos) {
        return Fail("scp must not get a shared -P option: " + mixed);
    }

    std::vector<std::string> captured;
    ScpTransfer transfer([&](const std::vector<std::string>& argv) {
        captured = argv;
        return Exited(1, "lost connection");
    });
    std::string error;
    if (transfer.Copy(remoteSrc, remoteDst, error)) {
        return Fail("Copy should fail when scp exits non-zero.");
    }
    if (captured.empty() || captured.front() != "scp" || error.find("lost connection") == std::string::npos) {
        return Fail("Copy did not surface the scp failure: " + error);
    }

    return 0;
}

int CheckSshQuoting() {
    if (SshExecutor::QuoteArgument("/srv/c1/images") != "/srv/c1/images") {
        return Fail("Plain arguments should not be quoted.");
    }
    if (SshExecutor::QuoteArgument("a b") != "'a b'") {
        return Fail("Arguments with spaces must be quoted.");
    }
    if (SshExecutor::QuoteArgument("it's") != "'it'\\''s'") {
        return Fail("Single quotes must be escaped.");
    }
    if (SshExecutor::QuoteArgument("") != "''") {
        return Fail("Empty arguments must survive the remote shell.");
    }

    const SshExecutor executor("node2", "root", 2222);
    const std::string command = Join(executor.BuildSshCommand({"mkdir", "-p", "/dst/my dir"}));
    if (command != "ssh -o BatchMode=yes -o ConnectTimeout=10 -o ServerAliveInterval=5 -o ServerAliveCountMax=3 -p 2222 root@node2 -- mkdir -p '/dst/my dir'") {
        return Fail("Unexpected ssh command: " + command);
    }

    const ResourceLocator locator = executor.Locator("/dst/c1");
    if (locator.ToString() != "root@node2:/dst/c1" || locator.port != 2222) {
        return Fail("Unexpected ssh locator: " + locator.ToString());
    }

    return 0;
}
} // namespace

int main() {
    if (int rc = CheckToolCommands()) {
        return rc;
    }
    if (int rc = CheckToolExecution()) {
        return rc;
    }
    if (int rc = CheckArchiveCommands()) {
        return rc;
    }
    if (int rc = CheckLivenessProbe()) {
        return rc;
    }
    if (int rc = CheckTransferCommands()) {
        return rc;
    }
    return CheckSshQuoting();
}
