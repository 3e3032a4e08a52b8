#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "instrumentation/profiler.hpp"

namespace {

cv::Mat
generate_frame(int width, int height, int frame_id)
{
  PROFTREE_FUNCTION();
  cv::Mat frame(height, width, CV_8UC3);
  cv::RNG rng(static_cast<uint64_t>(frame_id) + 1);
  rng.fill(frame, cv::RNG::UNIFORM, cv::Scalar::all(0), cv::Scalar::all(255));

  // A few shapes so the edge detector has something to find
  for (int i = 0; i < 8; ++i)
  {
    cv::Point center(rng.uniform(0, width), rng.uniform(0, height));
    cv::circle(frame, center, rng.uniform(10, 60), cv::Scalar(rng.uniform(0, 255), 0, 255), cv::FILLED);
  }
  return frame;
}

auto blur = proftree::wrap("blur",
                           [](const cv::Mat& input)
                           {
                             cv::Mat out;
                             cv::GaussianBlur(input, out, cv::Size(7, 7), 1.5);
                             return out;
                           });

auto downscale = proftree::wrap("downscale",
                                [](const cv::Mat& input, double factor)
                                {
                                  cv::Mat out;
                                  cv::resize(input, out, cv::Size(), factor, factor, cv::INTER_AREA);
                                  return out;
                                });

auto detect_edges = proftree::wrap("detect edges",
                                   [](const cv::Mat& input)
                                   {
                                     cv::Mat gray, edges;
                                     cv::cvtColor(input, gray, cv::COLOR_BGR2GRAY);
                                     cv::Canny(gray, edges, 50, 150);
                                     return edges;
                                   });

auto count_contours = proftree::wrap("count contours",
                                     [](const cv::Mat& edges)
                                     {
                                       std::vector<std::vector<cv::Point>> contours;
                                       cv::findContours(edges, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
                                       return contours.size();
                                     });

// Bucket named after the frame parity, computed from the call's arguments
auto process_frame = proftree::wrap(
  [](int frame_id, int, int)
  {
    return std::string(frame_id % 2 == 0 ? "process even frame" : "process odd frame");
  },
  [](int frame_id, int width, int height)
  {
    cv::Mat frame = generate_frame(width, height, frame_id);
    cv::Mat small = downscale(blur(frame), 0.5);
    return count_contours(detect_edges(small));
  });

size_t
process_sequence(int first_frame, int frames, int width, int height)
{
  size_t contours = 0;
  for (int frame_id = first_frame; frame_id < first_frame + frames; ++frame_id)
  {
    contours += process_frame(frame_id, width, height);
  }
  return contours;
}

// Joins every worker on scope exit, so a throwing frame never destroys a joinable thread
class WorkerJoiner
{
public:
  explicit WorkerJoiner(std::vector<std::thread>& workers) : _workers(workers) {}
  ~WorkerJoiner()
  {
    for (auto& worker : _workers)
    {
      if (worker.joinable())
        worker.join();
    }
  }

  WorkerJoiner(const WorkerJoiner&) = delete;
  WorkerJoiner&
  operator=(const WorkerJoiner&) = delete;

private:
  std::vector<std::thread>& _workers;
};

void
print_usage(const char* prog)
{
  std::cout << "Usage: " << prog << " [options]\n"
            << "Options:\n"
            << "  -n, --frames <n>     Frames per worker (default 20)\n"
            << "  -t, --threads <n>    Worker threads (default 2)\n"
            << "  -h, --help           Show this help\n"
            << "\nSet " << proftree::Config::kEnvVar << "=1 to enable profiling "
            << "(a numeric value sets the report filter in ms, default 10).\n";
}

} // namespace

int
main(int argc, char** argv)
{
  int frames = 20;
  int threads = 2;
  const int width = 1280;
  const int height = 720;

  // Parse command line args
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if ((arg == "-n" || arg == "--frames") && i + 1 < argc)
    {
      frames = std::stoi(argv[++i]);
    }
    else if ((arg == "-t" || arg == "--threads") && i + 1 < argc)
    {
      threads = std::stoi(argv[++i]);
    }
    else if (arg == "-h" || arg == "--help")
    {
      print_usage(argv[0]);
      return 0;
    }
  }

  if (frames < 0 || threads < 0)
  {
    std::cerr << "[proftree] frames and threads must not be negative" << std::endl;
    print_usage(argv[0]);
    return 1;
  }

  proftree::Session& session = proftree::Session::instance();
  if (!session.enabled())
  {
    std::cerr << "[proftree] profiling disabled, set " << proftree::Config::kEnvVar << " to enable" << std::endl;
  }

  size_t contours = proftree::run("pipeline",
                                  [&]
                                  {
                                    // Workers get their own call path; their buckets are top-level
                                    std::vector<std::thread> workers;
                                    std::vector<size_t> results(static_cast<size_t>(threads), 0);
                                    WorkerJoiner joiner(workers);
                                    for (int w = 0; w < threads; ++w)
                                    {
                                      workers.emplace_back(
                                        [&, w]
                                        {
                                          results[static_cast<size_t>(w)] =
                                            process_sequence(w * frames, frames, width, height);
                                        });
                                    }

                                    size_t total = process_sequence(threads * frames, frames, width, height);
                                    for (auto& worker : workers)
                                    {
                                      worker.join();
                                    }
                                    for (size_t r : results)
                                    {
                                      total += r;
                                    }
                                    return total;
                                  });

  std::cout << "Processed " << frames * (threads + 1) << " frames, " << contours << " contours" << std::endl;
  return 0;
}
