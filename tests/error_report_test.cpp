#include <gtest/gtest.h>

#include "App/ErrorReport.h"
#include "CropErrors.h"

#include <opencv2/core.hpp>

#include <new>
#include <sstream>
#include <system_error>

TEST(ErrorReportTest, CropErrorNamesItsStage) {
    std::ostringstream err;
    EXPECT_EQ(report_failure(OutputWriteError("disk full"), err), 1);
    EXPECT_NE(err.str().find("write stage"), std::string::npos);
    EXPECT_NE(err.str().find("disk full"), std::string::npos);
}

TEST(ErrorReportTest, OpenCvErrorIsLabelled) {
    std::ostringstream err;
    const cv::Exception e(cv::Error::StsError, "no display", "imshow", __FILE__, __LINE__);
    EXPECT_EQ(report_failure(e, err), 1);
    EXPECT_NE(err.str().find("OpenCV error"), std::string::npos);
}

TEST(ErrorReportTest, AnyOtherExceptionStillFails) {
    std::ostringstream thread_err;
    const std::system_error no_thread(std::make_error_code(std::errc::resource_unavailable_try_again));
    EXPECT_EQ(report_failure(no_thread, thread_err), 1);
    EXPECT_NE(thread_err.str().find("Unexpected error"), std::string::npos);

    std::ostringstream alloc_err;
    EXPECT_EQ(report_failure(std::bad_alloc(), alloc_err), 1);
    EXPECT_NE(alloc_err.str().find("Unexpected error"), std::string::npos);
}
