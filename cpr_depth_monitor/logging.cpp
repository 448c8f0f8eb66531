#include "logging.h"
#include "utils.h"

static std::string log_section_name[MAX_NESTED_SECTIONS];
static unsigned long log_section_start_time[MAX_NESTED_SECTIONS];
static int log_section_index = 0;

bool logging_on = true;

// ----- Internal Helpers -----
static std::string format_time(unsigned long ms) {
  unsigned long minutes = ms / 60000;
  ms %= 60000;
  unsigned long seconds = ms / 1000;
  unsigned long millis_part = ms % 1000;

  if (minutes > 0)
    return std::to_string(minutes) + "m" + std::to_string(seconds) + "s" + std::to_string(millis_part) + "ms";
  else if (seconds > 0)
    return std::to_string(seconds) + "s" + std::to_string(millis_part) + "ms";
  else
    return std::to_string(millis_part) + "ms";
}

static void log_println(const std::string& msg) {
  fputs(msg.c_str(), stderr);
  fputc('\n', stderr);
}

// ----- Indentation -----
void log_indent() {
  if (!logging_on) return;
  for (int i = 0; i < log_section_index && i < MAX_NESTED_SECTIONS; i++) {
    fputs("   ", stderr);
  }
}

// ----- Section Start -----
void log_section_start(const std::string& section_name) {
  if (!logging_on) return;

  unsigned long now = millis();
  std::string t = format_time(now);

  if (log_section_index < MAX_NESTED_SECTIONS) {
    log_section_name[log_section_index] = section_name;
    log_section_start_time[log_section_index] = now;
  }

  log_indent();
  log_println("---- {" + section_name + "} start <" + t + "> ----");

  log_section_index++;
  if (log_section_index > MAX_NESTED_SECTIONS)
    log_section_index = MAX_NESTED_SECTIONS;
}

// ----- Section Start with Variable -----
void log_section_start_var(const std::string& title, const std::string& var_name, const std::string& var_val) {
  std::string section = title + " | " + var_name + " {" + var_val + "}";
  log_section_start(section);
}

// ----- Section End -----
void log_section_end() {
  if (!logging_on) return;

  if (log_section_index < 1) {
    log_println("");
    return;
  }

  log_section_index--;
  unsigned long now = millis();
  unsigned long start_time = log_section_start_time[log_section_index];
  unsigned long delta = now - start_time;

  std::string section_name = log_section_name[log_section_index];
  std::string t_now = format_time(now);
  std::string t_delta = format_time(delta);

  log_indent();
  log_println("---- {" + section_name + "} end <" + t_now + ", Δ" + t_delta + "> ----");
}
