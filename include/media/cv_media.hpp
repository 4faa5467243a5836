#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace media
{

class Camera
{
  public:
    explicit Camera(int index) : index_(index) {}
    ~Camera() { release(); }
    Camera(const Camera &)            = delete;
    Camera &operator=(const Camera &) = delete;

    bool open();
    // false when no frame could be read this tick
    bool capture(cv::Mat &frame);
    void release();

  private:
    int              index_;
    cv::VideoCapture cap_;
};

class JpegCodec
{
  public:
    explicit JpegCodec(int quality = 90) : quality_(quality) {}

    bool compress(const cv::Mat &frame, std::vector<std::uint8_t> &out) const;
    bool decompress(const std::vector<std::uint8_t> &jpeg, cv::Mat &out) const;

  private:
    int quality_;
};

class Window
{
  public:
    explicit Window(std::string title) : title_(std::move(title)) {}
    ~Window();

    // Returns false once the user pressed 'q' or ESC
    bool show(const cv::Mat &frame);

  private:
    std::string title_;
    bool        shown_{false};
};

}  // namespace media
