#include "Logging/TextCropLogWriter.h"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

std::string TextCropLogWriter::log_path_for(const std::string& output_path)
{
    std::filesystem::path p(output_path);
    p.replace_extension();
    return p.string() + "_crop.txt";
}

std::string TextCropLogWriter::format(const OperationRecord& r)
{
    const std::time_t t = std::chrono::system_clock::to_time_t(r.timestamp);
    std::tm local{};
    localtime_r(&t, &local);

    const cv::Rect& roi = r.crop_rect;

    std::ostringstream oss;
    oss << "crpr:: operation log\n"
        << "timestamp:: " << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "\n"
        << "status:: cropped successfully\n\n"
        << "roi crop: (" << roi.x << ", " << roi.y << ", "
                         << roi.width << ", " << roi.height << ")\n"
        << "--------------------------\n"
        << "position: (" << roi.x << ", " << roi.y << ")\n"
        << "dimensions: " << roi.width << " x " << roi.height << " px\n";

    oss << "aspect ratio: ";
    if (roi.height != 0) {
        oss << std::fixed << std::setprecision(3)
            << static_cast<double>(roi.width) / roi.height;
        oss.unsetf(std::ios_base::floatfield);
    } else {
        oss << "N/A";
    }
    oss << "\n\n";

    oss << "source: " << r.source_path << "\n"
        << "output: " << r.output_path << "\n"
        << "source resolution: " << r.source_size.width << "x" << r.source_size.height << "\n"
        << "output resolution: " << r.output_size.width << "x" << r.output_size.height << "\n"
        << "frame rate: " << r.fps_num << "/" << r.fps_den << "\n"
        << "frames: " << r.frames_written << "\n";

    return oss.str();
}

bool TextCropLogWriter::write(const OperationRecord& record)
{
    const std::string path = log_path_for(record.output_path);

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        std::cerr << "[TextCropLogWriter] Cannot open " << path << "\n";
        return false;
    }

    out << format(record);
    out.flush();
    if (!out) {
        std::cerr << "[TextCropLogWriter] Write failed: " << path << "\n";
        return false;
    }

    std::cout << "[TextCropLogWriter] Log written to " << path << "\n";
    return true;
}
