#include "App/ErrorReport.h"
#include "CropErrors.h"

#include <opencv2/core.hpp>

int report_failure(const std::exception& error, std::ostream& err)
{
    if (const auto* crop = dynamic_cast<const CropError*>(&error)) {
        err << "[crpr] Failed at " << to_string(crop->stage()) << " stage: "
            << crop->what() << "\n";
    } else if (dynamic_cast<const cv::Exception*>(&error)) {
        // HighGUI without a display, mostly.
        err << "[crpr] OpenCV error: " << error.what() << "\n";
    } else {
        err << "[crpr] Unexpected error: " << error.what() << "\n";
    }
    return 1;
}
