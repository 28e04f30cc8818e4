/**********************************************************************
File name: main.cpp
This file is part of: userspacefs

LICENSE

This program is free software: you can redistribute it and/or modify it
under the terms of the GNU General Public License as published by the
Free Software Foundation, either version 3 of the License, or (at your
option) any later version.

This program is distributed in the hope that it will be useful, but
WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
General Public License for more details.

You should have received a copy of the GNU General Public License along
with this program.  If not, see <http://www.gnu.org/licenses/>.

FEEDBACK & QUESTIONS

For feedback and questions about userspacefs please e-mail one of the
authors named in the AUTHORS file.
**********************************************************************/
#define FUSE_USE_VERSION 31
#include <fuse_lowlevel.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>

#include <pthread.h>

#include <CLI/CLI.hpp>

#include "userspacefs/backend/in_memory.hpp"
#include "userspacefs/backend/local.hpp"
#include "userspacefs/backend/macos_names.hpp"
#include "userspacefs/config.hpp"
#include "userspacefs/dispatcher.hpp"
#include "userspacefs/fuse/channel.hpp"
#include "userspacefs/fuse/codec.hpp"
#include "userspacefs/logging.hpp"
#include "userspacefs/registry.hpp"
#include "userspacefs/session.hpp"
#include "userspacefs/smb/server.hpp"
#include "userspacefs/worker_pool.hpp"

using namespace Userspacefs;

static const char LOG_IDENT[] = "userspacefs";

static sigset_t termination_signals()
{
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    return set;
}

/**
 * Start the workers with the termination signals blocked, so that the
 * signals reach the thread serving the host.
 */
static std::unique_ptr<WorkerPool> start_workers(size_t threads)
{
    const sigset_t set = termination_signals();
    sigset_t old;
    pthread_sigmask(SIG_BLOCK, &set, &old);
    auto result = std::make_unique<WorkerPool>(threads);
    pthread_sigmask(SIG_SETMASK, &old, nullptr);
    return result;
}

/**
 * Split HOST[:PORT]. A missing port is returned as 0.
 */
static bool parse_listen_address(const std::string &text, std::string &host, uint16_t &port)
{
    const size_t colon = text.rfind(':');
    if (colon == std::string::npos) {
        host = text;
        port = 0;
        return !host.empty();
    }
    host = text.substr(0, colon);
    const std::string port_text = text.substr(colon + 1);
    if (host.empty() || port_text.empty() ||
            port_text.find_first_not_of("0123456789") != std::string::npos ||
            port_text.size() > 5) {
        return false;
    }
    const unsigned long value = std::stoul(port_text);
    if (value == 0 || value > 65535) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

class MountCommand
{
public:
    explicit MountCommand(CLI::App &app):
        m_cmd(*app.add_subcommand("mount", "Export a backend as a file system")),
        m_listen_address("127.0.0.1")
    {
        auto &backend_group = *m_cmd.add_option_group("Backend");
        backend_group.require_option(1, 1);
        backend_group.add_flag("-M,--memory", "Serve an empty in-memory file system");
        backend_group.add_option("-L,--local", m_local_path, "Serve a local directory")->type_name("PATH");

        m_cmd.add_flag("-d,--debug", "Enable debug output (implies -f)");
        m_cmd.add_flag("-f,--foreground", "Stay in foreground");
        m_cmd.add_flag("-v,--verbose", "Increase verbosity; may be repeated");
        m_cmd.add_flag("-s,--smb", "Export via SMB instead of FUSE");
        m_cmd.add_flag("-n,--smb-no-mount", "Export via SMB without mounting and print the address");
        m_cmd.add_option("-l,--smb-listen-address", m_listen_address,
                         "Address for the SMB server; a random port is picked if none is given")->type_name("HOST[:PORT]");
        m_cmd.add_option("-o", m_option_lists, "Mount options")->type_name("OPT[,OPT...]")->allow_extra_args(false);
        m_cmd.add_option("--name", m_display_name, "Display name of the file system")->type_name("NAME");

        m_cmd.add_option("mountpoint", m_mountpoint, "Path to the mountpoint")->type_name("PATH");
    }

private:
    CLI::App &m_cmd;

    std::string m_mountpoint;
    std::string m_local_path;
    std::string m_listen_address;
    std::string m_display_name;
    std::vector<std::string> m_option_lists;

    int run_fuse(Backend::Filesystem &fs, const Config &config, bool debug, bool foreground,
                 int verbosity) {
        std::unique_ptr<Fuse::Channel> channel;
        try {
            channel = std::make_unique<Fuse::Channel>(config.fuse_mount_options(), debug,
                                                      config.max_write);
        } catch (const std::runtime_error &exc) {
            logger().error("{}", exc.what());
            return -1;
        }

        auto handlers = channel->set_signal_handlers();
        if (!handlers) {
            std::cerr << "failed to set signal handlers" << std::endl;
            return 1;
        }

        auto mounted = channel->mount(m_mountpoint);
        if (!mounted) {
            logger().error("failed to mount FUSE file system at {}: {}", m_mountpoint,
                           errc_name(mounted.error()));
            return -1;
        }

        if (!foreground) {
            setup_logging(false, verbosity, LOG_IDENT);
        }
        fuse_daemonize(foreground);

        Registry registry(fs, config.max_handles);
        auto pool = start_workers(config.threads);
        Dispatcher dispatcher(fs, registry, *pool);
        Fuse::Codec codec(registry, config.fuse_codec_options());
        Session<Fuse::Codec> session(*channel, codec, dispatcher, 0);

        auto result = session.run();
        pool->shutdown();
        channel->unmount();
        return result ? 0 : 1;
    }

    int run_smb(Backend::Filesystem &fs, const Config &config, bool foreground, int verbosity) {
        std::string host;
        uint16_t port;
        if (!parse_listen_address(m_listen_address, host, port)) {
            std::cerr << "invalid listen address: " << m_listen_address << std::endl;
            return 2;
        }

        Smb::Server server(fs, config.smb_options());
        auto bound = server.bind(host, port);
        if (!bound) {
            std::cerr << "Unable to start SMB server" << std::endl;
            return 1;
        }
        std::cout << "You can access the SMB server at " << server.address() << std::endl;

        if (!foreground) {
            setup_logging(false, verbosity, LOG_IDENT);
        }
        fuse_daemonize(foreground);

        // every thread started from here on leaves the signals to the waiter
        const sigset_t signals = termination_signals();
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);
        std::atomic<bool> stopping(false);
        std::thread waiter([&server, &signals, &stopping]() {
            int signal = 0;
            if (sigwait(&signals, &signal) == 0 && !stopping) {
                logger().info("received signal {}, shutting down", signal);
            }
            server.shutdown();
        });

        WorkerPool pool(config.threads);
        auto result = server.serve(pool);
        stopping = true;
        pthread_kill(waiter.native_handle(), SIGTERM);
        waiter.join();
        pool.shutdown();
        return result ? 0 : 1;
    }

public:
    int execute() {
        const bool debug = m_cmd.count("-d");
        const bool foreground = debug || m_cmd.count("-f");
        const int verbosity = debug ? 2 : static_cast<int>(m_cmd.count("-v"));
        const bool smb_no_mount = m_cmd.count("-n");
        const bool smb_only = smb_no_mount || m_cmd.count("-s");

        setup_logging(true, verbosity, LOG_IDENT);

        Config config;
        if (!m_display_name.empty()) {
            config.display_name = m_display_name;
        }
        auto options = parse_options(m_option_lists);
        if (!options) {
            std::cerr << "malformed mount options" << std::endl;
            return 2;
        }
        auto applied = apply_options(config, *options);
        if (!applied) {
            std::cerr << "invalid mount options" << std::endl;
            return 2;
        }

        if (m_mountpoint.empty() && !smb_no_mount) {
            std::cerr << "a mount point is required unless --smb-no-mount is given" << std::endl;
            return 2;
        }

        std::unique_ptr<Backend::Filesystem> backend;
        if (m_cmd.count("--memory")) {
            backend = std::make_unique<Backend::InMemoryFilesystem>();
        } else {
            backend = std::make_unique<Backend::LocalFilesystem>(std::filesystem::path(m_local_path));
        }
        if (config.macos_names) {
            backend = std::make_unique<Backend::MacOSNamesFilesystem>(std::move(backend));
        }

        if (!smb_only) {
            const int ret = run_fuse(*backend, config, debug, foreground, verbosity);
            if (ret >= 0) {
                return ret;
            }
            // exporting via SMB would still need a mount, which is not done
            // automatically on this platform
            std::cerr << "Unable to mount file system" << std::endl;
            return 1;
        }

        if (!smb_no_mount) {
            std::cerr << "Unable to mount file system: mounting SMB automatically is not supported on this platform; use --smb-no-mount" << std::endl;
            return 1;
        }
        return run_smb(*backend, config, foreground, verbosity);
    }

    explicit operator bool() const {
        return bool(m_cmd);
    }

};


int main(int argc, char **argv) {
    CLI::App app{"userspacefs"};
    app.require_subcommand(1);

    MountCommand mount(app);

    CLI11_PARSE(app, argc, argv);

    if (mount) {
        return mount.execute();
    }
    return 0;
}
