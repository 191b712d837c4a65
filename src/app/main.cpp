
#include "coordinator.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "payload_io.hpp"
#include "peer_node.hpp"
#include "util.hpp"
#include <algorithm>
#include <asio.hpp>
#include <csignal>
#include <cstdio>
#include <iostream>

using namespace ferry;

static void usage() {
  std::cerr << "usage:\n"
               "  ferry recv --listen HOST:PORT [--out DIR] [--auto-accept]\n"
               "  ferry send FILE --to HOST:PORT [--no-direct] [--rate N] "
               "[--chunk N]\n"
               "common: [--name NAME] [--high-water N] [--timeout MS] "
               "[--log-level LEVEL]\n";
}

static void print_progress(const char *verb, int percent, double speed,
                           uint64_t eta_s) {
  std::fprintf(stderr, "\r%s %3d%%  %s/s  eta %llus   ", verb, percent,
               format_bytes(speed).c_str(), (unsigned long long)eta_s);
  std::fflush(stderr);
}

struct Options {
  std::string mode;
  std::string file;
  std::string listen;
  std::string to;
  std::string out = ".";
  std::string name = "ferry";
  bool auto_accept = false;
  TransferConfig cfg;
};

static int run_recv(const Options &o) {
  std::string host;
  uint16_t port;
  if (!parse_host_port(o.listen, host, port)) {
    std::cerr << "bad listen" << std::endl;
    return 1;
  }
  asio::io_context io;
  NodeOptions nopts;
  nopts.name = o.name;
  nopts.high_water = o.cfg.high_water;
  nopts.direct = o.cfg.prefer_direct;
  PeerNode node(io, nopts);
  TransferCoordinator coord(io, o.cfg, node, node, o.name);
  node.attach(&coord);
  std::string out_dir = o.out;
  coord.set_sink_factory([out_dir](const PeerId &, const OfferMeta &offer) {
    return std::unique_ptr<PayloadSink>(new DiskSink(out_dir, offer.name));
  });

  int status = 1;
  bool done = false;
  auto finish = [&](int code) {
    if (done)
      return;
    done = true;
    status = code;
    node.close_when_drained([&io]() { io.stop(); });
  };
  coord.events().subscribe([&](const TransferEvent &ev) {
    if (auto *in = std::get_if<IncomingFile>(&ev)) {
      std::cerr << in->sender_name << " offers " << in->file_name << " ("
                << format_bytes((double)in->file_size) << ", " << in->mime_type
                << ")" << std::endl;
      bool take = o.auto_accept;
      if (!take) {
        std::cerr << "accept? [y/N] " << std::flush;
        std::string line;
        std::getline(std::cin, line);
        take = !line.empty() && (line[0] == 'y' || line[0] == 'Y');
      }
      std::error_code ec = take ? coord.accept(in->peer) : coord.reject(in->peer);
      if (ec)
        std::cerr << "cannot answer offer: " << ec.message() << std::endl;
    } else if (auto *p = std::get_if<ReceiveProgress>(&ev)) {
      print_progress("recv", p->percent, p->speed, p->eta_s);
    } else if (auto *r = std::get_if<FileReceived>(&ev)) {
      std::cerr << "\nreceived " << r->file_name << " ("
                << format_bytes((double)r->size) << ")";
      if (!r->path.empty())
        std::cerr << " -> " << r->path;
      std::cerr << std::endl;
      finish(0);
    } else if (auto *e = std::get_if<TransferError>(&ev)) {
      std::cerr << "\ntransfer failed: " << e->reason << std::endl;
      finish(1);
    }
  });

  try {
    node.listen(host, port);
  } catch (const std::exception &e) {
    Logger::instance().log(LogLevel::ERROR, "cannot listen on %s: %s",
                           o.listen.c_str(), e.what());
    return 1;
  }
  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](const std::error_code &ec, int) {
    if (ec)
      return;
    for (auto &peer : node.peers()) {
      if (coord.state(peer) == PairState::Idle)
        continue;
      if (std::error_code cec = coord.cancel(peer))
        Logger::instance().log(LogLevel::WARN, "cancel %s: %s", peer.c_str(),
                               cec.message().c_str());
    }
    finish(1);
  });
  io.run();
  return status;
}

static int run_send(const Options &o) {
  std::string host;
  uint16_t port;
  if (!parse_host_port(o.to, host, port)) {
    std::cerr << "bad target" << std::endl;
    return 1;
  }
  auto source = DiskFileSource::open(o.file);
  if (!source) {
    std::cerr << "cannot open " << o.file << std::endl;
    return 1;
  }

  asio::io_context io;
  NodeOptions nopts;
  nopts.name = o.name;
  nopts.high_water = o.cfg.high_water;
  nopts.direct = o.cfg.prefer_direct;
  PeerNode node(io, nopts);
  TransferCoordinator coord(io, o.cfg, node, node, o.name);
  node.attach(&coord);

  int status = 1;
  bool done = false;
  auto finish = [&](int code) {
    if (done)
      return;
    done = true;
    status = code;
    node.close_when_drained([&io]() { io.stop(); });
  };
  coord.events().subscribe([&](const TransferEvent &ev) {
    if (auto *s = std::get_if<TransferStarted>(&ev)) {
      std::cerr << "sending " << s->file_name << " ("
                << format_bytes((double)s->total) << ") via "
                << channel_kind_name(s->channel) << std::endl;
    } else if (auto *p = std::get_if<TransferProgress>(&ev)) {
      print_progress("send", p->percent, p->speed, p->eta_s);
    } else if (std::get_if<TransferComplete>(&ev)) {
      std::cerr << "\ndone" << std::endl;
      finish(0);
    } else if (auto *r = std::get_if<TransferRejected>(&ev)) {
      std::cerr << r->code.message() << ": " << r->reason << std::endl;
      finish(1);
    } else if (auto *e = std::get_if<TransferError>(&ev)) {
      std::cerr << "\ntransfer failed: " << e->reason << std::endl;
      finish(1);
    }
  });

  node.on_peer_up([&](const PeerId &peer, const std::string &name) {
    std::cerr << "connected to " << name << ", waiting for acceptance"
              << std::endl;
    std::error_code ec = coord.offer(peer, source);
    if (ec) {
      std::cerr << "cannot offer: " << ec.message() << std::endl;
      finish(1);
    }
  });
  node.on_peer_down([&](const PeerId &, const std::string &name) {
    if (!done)
      std::cerr << name << " went away" << std::endl;
    finish(1);
  });
  node.connect(host, port, [&](std::error_code ec) {
    if (ec) {
      std::cerr << "cannot connect to " << o.to << ": " << ec.message()
                << std::endl;
      finish(1);
    }
  });

  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](const std::error_code &ec, int) {
    if (ec)
      return;
    for (auto &peer : node.peers()) {
      if (coord.state(peer) == PairState::Idle)
        continue;
      if (std::error_code cec = coord.cancel(peer))
        Logger::instance().log(LogLevel::WARN, "cancel %s: %s", peer.c_str(),
                               cec.message().c_str());
    }
    finish(1);
  });
  io.run();
  return status;
}

int main(int argc, char **argv) {
  Logger::instance().configure_from_env();
  if (!init_sodium()) {
    std::cerr << "libsodium initialisation failed" << std::endl;
    return 1;
  }
  if (argc < 2) {
    usage();
    return 1;
  }

  Options o;
  o.mode = argv[1];
  for (int i = 2; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    auto size_arg = [&](int &i) -> uint64_t {
      std::string v = next(i);
      uint64_t n = 0;
      if (!parse_size(v, n)) {
        std::cerr << "bad size for " << a << ": " << v << "\n";
        std::exit(1);
      }
      return n;
    };
    if (a == "--listen")
      o.listen = next(i);
    else if (a == "--to")
      o.to = next(i);
    else if (a == "--out")
      o.out = next(i);
    else if (a == "--name")
      o.name = next(i);
    else if (a == "--auto-accept")
      o.auto_accept = true;
    else if (a == "--no-direct")
      o.cfg.prefer_direct = false;
    else if (a == "--rate")
      o.cfg.rate_limit = size_arg(i);
    else if (a == "--chunk") {
      uint64_t c = size_arg(i);
      if (c == 0 || c > 64 * 1024 * 1024) {
        std::cerr << "chunk size out of range\n";
        return 1;
      }
      o.cfg.relay_chunk_size = (uint32_t)c;
      o.cfg.direct_chunk_size = (uint32_t)std::min<uint64_t>(c, 60 * 1024);
    } else if (a == "--high-water")
      o.cfg.high_water = (size_t)size_arg(i);
    else if (a == "--timeout")
      o.cfg.establish_timeout = std::chrono::milliseconds(size_arg(i));
    else if (a == "--log-level") {
      LogLevel lvl;
      if (!parse_log_level(next(i), lvl)) {
        std::cerr << "bad log level\n";
        return 1;
      }
      Logger::instance().set_level(lvl);
    } else if (o.mode == "send" && o.file.empty() && a[0] != '-')
      o.file = a;
    else {
      std::cerr << "unknown argument " << a << "\n";
      usage();
      return 1;
    }
  }

  if (o.mode == "recv" && !o.listen.empty())
    return run_recv(o);
  if (o.mode == "send" && !o.file.empty() && !o.to.empty())
    return run_send(o);
  usage();
  return 1;
}
