#include <opencv2/highgui.hpp>
#include <opencv2/imgcodecs.hpp>

#include "media/cv_media.hpp"
#include "util/log.hpp"

namespace media
{

bool Camera::open()
{
    if (!cap_.open(index_))
    {
        LOG_ERROR("could not open camera %d (missing or in use)", index_);
        return false;
    }
    LOG_INFO("camera %d opened", index_);
    return true;
}

bool Camera::capture(cv::Mat &frame)
{
    if (!cap_.read(frame) || frame.empty())
    {
        LOG_WARN("failed to read a frame from camera %d", index_);
        return false;
    }
    return true;
}

void Camera::release()
{
    if (cap_.isOpened())
    {
        cap_.release();
        LOG_INFO("camera %d released", index_);
    }
}

bool JpegCodec::compress(const cv::Mat &frame, std::vector<std::uint8_t> &out) const
{
    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality_};
    std::vector<uchar>     buf;
    if (!cv::imencode(".jpg", frame, buf, params))
    {
        LOG_ERROR("JPEG encode failed (%dx%d)", frame.cols, frame.rows);
        return false;
    }
    out.assign(buf.begin(), buf.end());
    return true;
}

bool JpegCodec::decompress(const std::vector<std::uint8_t> &jpeg, cv::Mat &out) const
{
    out = cv::imdecode(jpeg, cv::IMREAD_COLOR);
    if (out.empty())
    {
        LOG_WARN("JPEG decode failed (%zu bytes)", jpeg.size());
        return false;
    }
    return true;
}

Window::~Window()
{
    if (shown_)
        cv::destroyWindow(title_);
}

bool Window::show(const cv::Mat &frame)
{
    cv::imshow(title_, frame);
    shown_  = true;
    int key = cv::waitKey(1) & 0xFF;
    return key != 'q' && key != 27;
}

}  // namespace media
