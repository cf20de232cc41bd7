/**
 * @file
 * @version 1.0
 *
 * @section LICENSE
 *
 * Copyright [2012] [Carnegie Mellon University]
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.

 *
 * @section DESCRIPTION
 *
 * Category diversity of a list of observations. Each line of the input
 * file is one observation: a single category label, or several labels
 * separated by --separator for a multi-label item. Prints the Gini
 * coefficient, effective catalog size, Shannon index, the distribution
 * table and the Lorenz curve coordinates.
 *
 * Usage:
 *   diversity_report --input=genres.txt [--separator=|] [--base=2.718281828]
 *       [--bar_width=40] [--precision=4]
 */

#include <cstdio>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "divrank_basic_includes.hpp"
#include "output/output.hpp"

using namespace divrank;

const char line_ends[] = {"\r\n"};

/* Splits one input line into its labels. Returns false at end of file. */
static bool get_one_line(FILE * pfile, const std::string & separator, std::vector<std::string> & labels) {
  char * saveptr = NULL, * linebuf = NULL;
  size_t linesize = 0;
  labels.clear();

  int rc = getline(&linebuf, &linesize, pfile);
  if (rc < 1) {
    free(linebuf);
    return false;
  }
  linebuf[strcspn(linebuf, line_ends)] = '\0';

  bool first_time = true;
  while (true) {
    char * pch = strtok_r(first_time ? linebuf : NULL, separator.c_str(), &saveptr);
    first_time = false;
    if (!pch)
      break;
    std::string label = trim(pch);
    if (label != "")
      labels.push_back(label);
  }
  free(linebuf);
  return true;
}

static std::vector<category_item<std::string> > read_observations(const std::string & filename, const std::string & separator) {
  FILE * pfile = fopen(filename.c_str(), "r");
  if (pfile == NULL)
    logstream(LOG_FATAL) << "Failed to open input file: " << filename << std::endl;

  std::vector<category_item<std::string> > items;
  std::vector<std::string> labels;
  size_t lines = 0, empty_lines = 0;
  while (get_one_line(pfile, separator, labels)) {
    lines++;
    if (labels.empty())
      empty_lines++;
    else if (labels.size() == 1)
      items.push_back(scalar_item(labels[0]));
    else items.push_back(labels_item(labels));
  }
  fclose(pfile);
  if (empty_lines > 0)
    logstream(LOG_WARNING) << "Skipped " << empty_lines << " empty lines of " << lines << std::endl;
  logstream(LOG_INFO) << "Read " << items.size() << " observations from " << filename << std::endl;
  return items;
}

int main(int argc, const char ** argv) {

  divrank_init(argc, argv);
  global_logger().set_log_level(get_option_int("loglevel", LOG_INFO));

  metrics m("diversity-report");

  try {
    std::string input = get_option_string("input");
    std::string separator = get_option_string("separator", "|");
    double base = get_option_float("base", std::exp(1.0));

    render_config rconfig;
    rconfig.bar_width = get_option_int("bar_width", rconfig.bar_width);
    rconfig.precision = get_option_int("precision", rconfig.precision);

    metrics_entry me = m.start_time();
    histogram<std::string> hist = build_histogram(read_observations(input, separator));
    vec counts = hist.counts();

    diversity_summary s = summarize(hist);
    s.shannon = shannon_index(counts, base);
    distribution_table<std::string> table = get_distribution(hist);
    lorenz_curve curve = get_lorenz_curve(counts);
    m.stop_time(me, "diversity_metrics");

    basic_text_output<std::string> out(std::cout, rconfig);
    out.output_summary(s);
    std::cout << std::endl << "# category, count, percentage" << std::endl;
    out.output_distribution(table);
    std::cout << std::endl << "# lorenz x, lorenz y" << std::endl;
    out.output_lorenz(curve);

    m.set("gini", s.gini);
    m.set("ecs", s.ecs);
    m.set("shannon", s.shannon);
    m.set("categories", s.categories);
    m.set("observations", s.observations);
  } catch (divrank_error & e) {
    logstream(LOG_ERROR) << "diversity_report failed: " << e.what() << std::endl;
    return 1;
  }

  metrics_report(m);
  return 0;
}
