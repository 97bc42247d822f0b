#include "stexporter/remote_client.hpp"
#include "stexporter/errors.hpp"
#include "stexporter/log.hpp"
#include "stexporter/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <set>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace stexporter {

namespace {

std::string lower(std::string s) {
  for (auto &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// токен уходит только на тот же scheme://host:port, что и base_url
bool same_origin(const std::string &a, const std::string &b) {
  try {
    const Url ua = parse_url(a);
    const Url ub = parse_url(b);
    return ua.scheme == ub.scheme && lower(ua.host) == lower(ub.host) &&
           ua.port == ub.port;
  } catch (const std::invalid_argument &) {
    return false;
  }
}

bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)); }
bool is_lower_or_digit(char c) {
  return std::islower(static_cast<unsigned char>(c)) ||
         std::isdigit(static_cast<unsigned char>(c));
}

json parse_body(const std::string &body, const char *what) {
  try {
    return json::parse(body);
  } catch (const json::parse_error &e) {
    throw NetworkError(std::string("malformed ") + what + " response: " +
                           e.what(),
                       200);
  }
}

bool to_value(const json &v, CapabilityValue &out) {
  if (v.is_boolean()) {
    out = v.get<bool>();
    return true;
  }
  if (v.is_number()) {
    out = v.get<double>();
    return true;
  }
  if (v.is_string()) {
    out = v.get<std::string>();
    return true;
  }
  return false; // null, массивы, вложенные объекты
}

bool retryable(int status) {
  return status == 408 || status == 429 || status >= 500;
}

} // namespace

std::chrono::milliseconds RetryPolicy::delay_for(int attempt,
                                                 std::mt19937_64 &rng) const {
  const int shift = std::min(std::max(attempt - 1, 0), 20);
  const long long raw = static_cast<long long>(base_delay.count()) << shift;
  const long long capped = std::min<long long>(raw, max_delay.count());
  const long long half = capped / 2;
  std::uniform_int_distribution<long long> jitter(0, capped - half);
  return std::chrono::milliseconds(half + jitter(rng));
}

SmartThingsClient::SmartThingsClient(std::string base_url,
                                     HttpTransport &transport,
                                     Credential &credential, RetryPolicy retry,
                                     std::chrono::milliseconds call_timeout,
                                     Sleeper sleeper)
    : base_url_(std::move(base_url)), transport_(transport),
      credential_(credential), retry_(retry), call_timeout_(call_timeout),
      sleeper_(std::move(sleeper)), rng_(std::random_device{}()) {
  while (!base_url_.empty() && base_url_.back() == '/')
    base_url_.pop_back();
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) {
      boost::this_thread::sleep_for(boost::chrono::milliseconds(d.count()));
    };
  }
}

void SmartThingsClient::backoff(int attempt, int retry_after_s) {
  std::chrono::milliseconds delay;
  {
    boost::lock_guard<boost::mutex> lk(rng_m_);
    delay = retry_.delay_for(attempt, rng_);
  }
  if (retry_after_s > 0) {
    delay = std::max(delay, std::chrono::milliseconds(retry_after_s * 1000LL));
    delay = std::min(delay, retry_.max_delay);
  }
  log_dbg("API", "backing off " + std::to_string(delay.count()) +
                     "ms before attempt " + std::to_string(attempt + 1));
  sleeper_(delay);
}

HttpResponse SmartThingsClient::call(const std::string &url) {
  auto token = credential_.current();
  bool refreshed = false;
  int attempt = 0;

  for (;;) {
    ++attempt;
    HttpResponse res;
    try {
      requests_.fetch_add(1, std::memory_order_relaxed);
      res = transport_.get(url, token.value, call_timeout_);
    } catch (const NetworkError &e) {
      if (attempt >= retry_.max_attempts) {
        throw NetworkError("GET " + url + " failed after " +
                               std::to_string(attempt) +
                               " attempts: " + e.what(),
                           e.status());
      }
      log_dbg("API", std::string("transport error: ") + e.what());
      backoff(attempt, -1);
      continue;
    }

    if (res.status >= 200 && res.status < 300)
      return res;

    if (res.status == 401 || res.status == 403) {
      if (refreshed) {
        throw AuthError("GET " + url + " rejected after credential refresh",
                        res.status);
      }
      refreshed = true;
      // повтор после refresh не тратит бюджет попыток
      --attempt;
      try {
        token = credential_.refresh(token.generation);
      } catch (const AuthError &) {
        throw;
      } catch (const std::exception &e) {
        throw AuthError(std::string("credential refresh failed: ") + e.what(),
                        res.status);
      }
      continue;
    }

    if (res.status == 404)
      throw NotFoundError("GET " + url + ": not found", 404);

    if (!retryable(res.status)) {
      throw NetworkError("GET " + url + ": unexpected status " +
                             std::to_string(res.status),
                         res.status);
    }
    if (attempt >= retry_.max_attempts) {
      throw NetworkError("GET " + url + " failed after " +
                             std::to_string(attempt) + " attempts, last status " +
                             std::to_string(res.status),
                         res.status);
    }
    if (res.status == 429)
      log_dbg("API", "rate limited on " + url);
    backoff(attempt, res.retry_after_s);
  }
}

std::vector<Device> SmartThingsClient::list_devices() {
  std::vector<Device> out;
  std::set<std::string> seen;
  std::string url = base_url_ + "/devices";
  std::set<std::string> visited;

  while (!url.empty()) {
    if (!visited.insert(url).second)
      throw NetworkError("device listing pagination loops at " + url, 200);
    std::string next;
    auto page = parse_device_page(call(url).body, next);
    for (auto &d : page) {
      if (seen.insert(d.id).second)
        out.push_back(std::move(d));
    }
    if (!next.empty() && !same_origin(base_url_, next))
      throw NetworkError("device listing links to a foreign origin: " + next,
                         200);
    url = std::move(next);
  }
  return out;
}

std::vector<CapabilityReading>
SmartThingsClient::get_capabilities(const std::string &device_id) {
  return parse_device_status(
      device_id, call(base_url_ + "/devices/" + device_id + "/status").body);
}

std::string to_snake_case(const std::string &name) {
  std::string out;
  out.reserve(name.size() + 8);
  for (std::size_t i = 0; i < name.size(); ++i) {
    const char c = name[i];
    if (c == '-' || c == ' ' || c == '.') {
      out.push_back('_');
      continue;
    }
    if (is_upper(c) && i > 0) {
      const char prev = name[i - 1];
      const bool next_lower = i + 1 < name.size() &&
                              std::islower(static_cast<unsigned char>(name[i + 1]));
      // "airMode" -> air_mode, "ACMode" -> ac_mode
      if (is_lower_or_digit(prev) || (is_upper(prev) && next_lower))
        out.push_back('_');
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

std::vector<Device> parse_device_page(const std::string &body,
                                      std::string &next_url) {
  const json j = parse_body(body, "device list");
  std::vector<Device> out;
  next_url.clear();

  if (!j.is_object() || !j.contains("items") || !j["items"].is_array())
    throw NetworkError("device list response has no items array", 200);

  for (const auto &item : j["items"]) {
    if (!item.is_object() || !item.contains("deviceId") ||
        !item["deviceId"].is_string())
      continue;
    Device d;
    d.id = item["deviceId"].get<std::string>();
    if (item.contains("label") && item["label"].is_string())
      d.label = item["label"].get<std::string>();
    if (item.contains("name") && item["name"].is_string())
      d.name = item["name"].get<std::string>();

    std::set<std::string> caps;
    if (item.contains("components") && item["components"].is_array()) {
      for (const auto &comp : item["components"]) {
        if (!comp.contains("capabilities") || !comp["capabilities"].is_array())
          continue;
        for (const auto &cap : comp["capabilities"]) {
          if (cap.contains("id") && cap["id"].is_string())
            caps.insert(cap["id"].get<std::string>());
        }
      }
    }
    d.capabilities.assign(caps.begin(), caps.end());
    out.push_back(std::move(d));
  }

  if (j.contains("_links") && j["_links"].is_object()) {
    const auto &links = j["_links"];
    if (links.contains("next") && links["next"].is_object() &&
        links["next"].contains("href") && links["next"]["href"].is_string())
      next_url = links["next"]["href"].get<std::string>();
  }
  return out;
}

std::vector<CapabilityReading> parse_device_status(const std::string &device_id,
                                                   const std::string &body) {
  const json j = parse_body(body, "device status");
  std::vector<CapabilityReading> out;
  if (!j.is_object() || !j.contains("components") ||
      !j["components"].is_object())
    throw NetworkError("device status response has no components", 200);

  for (const auto &[component, caps] : j["components"].items()) {
    if (!caps.is_object())
      continue;
    for (const auto &[capability, attrs] : caps.items()) {
      if (!attrs.is_object())
        continue;
      for (const auto &[attribute, state] : attrs.items()) {
        if (!state.is_object() || !state.contains("value"))
          continue;

        std::int64_t ts = 0;
        if (state.contains("timestamp") && state["timestamp"].is_string()) {
          ts = parse_iso8601_ms(state["timestamp"].get<std::string>())
                   .value_or(0);
        }

        const json &value = state["value"];
        if (value.is_object()) {
          // составной атрибут: каждое поле: отдельное чтение
          for (const auto &[sub_name, sub_value] : value.items()) {
            CapabilityReading r;
            if (!to_value(sub_value, r.value))
              continue;
            r.device_id = device_id;
            r.component = component;
            r.name = to_snake_case(sub_name);
            r.timestamp_ms = ts;
            out.push_back(std::move(r));
          }
          continue;
        }

        CapabilityReading r;
        if (!to_value(value, r.value))
          continue;
        r.device_id = device_id;
        r.component = component;
        r.name = to_snake_case(attribute);
        r.timestamp_ms = ts;
        out.push_back(std::move(r));
      }
    }
  }
  return out;
}

} // namespace stexporter
