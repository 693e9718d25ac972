#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "mpcrec/common/clock.hpp"
#include "mpcrec/common/logging.hpp"
#include "mpcrec/crypto/random.hpp"
#include "mpcrec/node/local_cluster.hpp"
#include "mpcrec/verify/binding_message.hpp"

namespace {

using mpcrec::AddRecoveryMethodRequest;
using mpcrec::ECPoint;
using mpcrec::Envelope;
using mpcrec::Identity;
using mpcrec::LocalCluster;
using mpcrec::LocalClusterOptions;
using mpcrec::PartyIndex;
using mpcrec::RecoverAccountRequest;
using mpcrec::RecoveryError;
using mpcrec::Scalar;

struct BenchArgs {
  uint32_t n = 4;
  uint32_t t = 0;
  uint32_t iters = 10;
  std::string account = "alice.near";
  std::string identity = "google:alice@example.com";
  std::vector<PartyIndex> offline;
  uint32_t timeout_ms = 10000;
  std::string log_level = "warn";
};

struct PhaseMetric {
  double total_ms = 0.0;
  uint64_t total_bytes = 0;
  uint64_t samples = 0;
  uint64_t failures = 0;
};

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

uint32_t ParsePositiveU32(const char* value, const char* flag) {
  try {
    const unsigned long parsed = std::stoul(value);
    if (parsed == 0 || parsed > UINT32_MAX) {
      throw std::out_of_range("out of range");
    }
    return static_cast<uint32_t>(parsed);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string("invalid value for ") + flag + ": " + value);
  }
}

BenchArgs ParseArgs(int argc, char** argv) {
  BenchArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (flag == "--n" && i + 1 < argc) {
      args.n = ParsePositiveU32(argv[++i], "--n");
    } else if (flag == "--t" && i + 1 < argc) {
      args.t = ParsePositiveU32(argv[++i], "--t");
    } else if (flag == "--iters" && i + 1 < argc) {
      args.iters = ParsePositiveU32(argv[++i], "--iters");
    } else if (flag == "--account" && i + 1 < argc) {
      args.account = argv[++i];
    } else if (flag == "--identity" && i + 1 < argc) {
      args.identity = argv[++i];
    } else if (flag == "--offline" && i + 1 < argc) {
      args.offline.push_back(ParsePositiveU32(argv[++i], "--offline"));
    } else if (flag == "--timeout-ms" && i + 1 < argc) {
      args.timeout_ms = ParsePositiveU32(argv[++i], "--timeout-ms");
    } else if (flag == "--log-level" && i + 1 < argc) {
      args.log_level = argv[++i];
    } else if (flag == "--help") {
      std::cout << "Usage: recovery_bench [--n N] [--t T] [--iters K] [--account A]\n"
                   "                      [--identity provider:subject] [--offline ID]...\n"
                   "                      [--timeout-ms MS] [--log-level LEVEL]\n";
      std::exit(0);
    } else {
      throw std::invalid_argument("unknown argument: " + flag);
    }
  }

  if (args.n < 2) {
    throw std::invalid_argument("--n must be >= 2");
  }
  if (args.t == 0) {
    args.t = args.n - 1;
  }
  if (args.t < 2 || args.t > args.n) {
    throw std::invalid_argument("--t must satisfy 2 <= t <= n");
  }
  for (PartyIndex id : args.offline) {
    if (id < 2 || id > args.n) {
      throw std::invalid_argument("--offline must name a party in 2..n (party 1 initiates)");
    }
  }
  return args;
}

void RecordMetric(PhaseMetric* metric,
                  std::chrono::steady_clock::time_point start,
                  std::chrono::steady_clock::time_point end,
                  uint64_t bytes) {
  metric->total_ms += std::chrono::duration<double, std::milli>(end - start).count();
  metric->total_bytes += bytes;
  metric->samples += 1;
}

void PrintMetricLine(const std::string& name, const PhaseMetric& metric) {
  const double samples = metric.samples == 0 ? 1.0 : static_cast<double>(metric.samples);
  std::cout << std::left << std::setw(14) << name << "  "
            << std::right << std::setw(12) << std::fixed << std::setprecision(3)
            << metric.total_ms / samples << "  "
            << std::setw(14) << std::fixed << std::setprecision(1)
            << static_cast<double>(metric.total_bytes) / samples << "  "
            << std::setw(8) << metric.failures << '\n';
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const BenchArgs args = ParseArgs(argc, argv);
    mpcrec::SetLogLevel(spdlog::level::from_str(args.log_level));
    const Identity identity = Identity::Parse(args.identity);

    std::cout << "recovery benchmark config: n=" << args.n
              << ", t=" << args.t
              << ", iters=" << args.iters
              << ", offline=" << args.offline.size()
              << ", timeout_ms=" << args.timeout_ms << '\n';

    LocalClusterOptions options;
    options.n = args.n;
    options.threshold = args.t;
    options.trusted_providers = {identity.provider};
    options.session_timeout = std::chrono::milliseconds(args.timeout_ms);
    options.submit_to_chain = true;
    LocalCluster cluster(options);

    std::atomic<uint64_t> wire_bytes{0};
    cluster.network().SetInterceptor([&wire_bytes](const Envelope& envelope) {
      wire_bytes += mpcrec::EncodeEnvelope(envelope).size();
      return std::vector<Envelope>{envelope};
    });

    const Scalar account_key = mpcrec::Csprng::RandomNonZeroScalar();
    cluster.chain().CreateAccount(args.account, ECPoint::GeneratorMultiply(account_key));

    PhaseMetric add_metric;
    {
      const std::string token = cluster.IssueToken(identity);
      AddRecoveryMethodRequest request;
      request.access_token = token;
      request.account_id = args.account;
      request.proof = mpcrec::SignBindingMessage(
          account_key, args.account, token, mpcrec::Csprng::RandomBytes(32),
          mpcrec::ToUnixSeconds(std::chrono::system_clock::now()));

      wire_bytes = 0;
      const auto start = std::chrono::steady_clock::now();
      const auto result = cluster.node(1).AddRecoveryMethod(request);
      RecordMetric(&add_metric, start, std::chrono::steady_clock::now(), wire_bytes);
      Expect(result.newly_registered, "recovery method was not newly registered");
      cluster.chain().AddKey(args.account, result.recovery_public_key);
      std::cout << "recovery key: " << result.recovery_public_key.ToHex() << '\n';
    }

    for (PartyIndex id : args.offline) {
      cluster.SetOnline(id, false);
    }

    PhaseMetric recover_metric;
    for (uint32_t i = 0; i < args.iters; ++i) {
      RecoverAccountRequest request;
      request.access_token = cluster.IssueToken(identity);
      request.account_id = args.account;
      request.new_public_key = ECPoint::GeneratorMultiply(mpcrec::Csprng::RandomNonZeroScalar());

      wire_bytes = 0;
      const auto start = std::chrono::steady_clock::now();
      try {
        cluster.node(1).RecoverAccount(request);
        RecordMetric(&recover_metric, start, std::chrono::steady_clock::now(), wire_bytes);
        Expect(cluster.chain().HasKey(args.account, request.new_public_key),
               "recovered key missing on chain");
      } catch (const RecoveryError& ex) {
        recover_metric.failures += 1;
        std::cerr << "recover round " << i << " failed: " << ex.what() << '\n';
      }
    }

    std::cout << "\n" << std::left << std::setw(14) << "Operation"
              << "  " << std::right << std::setw(12) << "Avg ms"
              << "  " << std::setw(14) << "Avg bytes"
              << "  " << std::setw(8) << "Failed" << '\n';
    PrintMetricLine("add-method", add_metric);
    PrintMetricLine("recover", recover_metric);
  } catch (const std::exception& ex) {
    std::cerr << "benchmark failed: " << ex.what() << '\n';
    return 1;
  }
  return 0;
}
