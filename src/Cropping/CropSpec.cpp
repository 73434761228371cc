#include "interfaces.h"
#include "CropErrors.h"

#include <sstream>
#include <utility>

CropSpec::CropSpec(cv::Rect    rect,
                   std::string source_path,
                   std::string output_path,
                   std::string encoder)
    : rect_(rect)
    , source_path_(std::move(source_path))
    , output_path_(std::move(output_path))
    , encoder_(std::move(encoder))
{
    if (rect_.width <= 0 || rect_.height <= 0 || rect_.x < 0 || rect_.y < 0) {
        std::ostringstream oss;
        oss << "Crop rectangle must have a positive size and origin >= 0, got " << rect_;
        throw InvalidSelection(oss.str());
    }
}
