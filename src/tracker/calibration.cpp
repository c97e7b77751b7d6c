#include "calibration.hpp"
#include "utils/math.hpp"
#include <algorithm>
#include <chrono>

namespace calibration
{
    CalibrationData getDefaultCalibration(int width, int height)
    {
        CalibrationData data;
        data.center = Point2f(width / 2.0f, height / 2.0f);
        data.radius = std::min(width, height) * 0.4;
        data.timestamp = currentTimestampMs();
        return data;
    }

    bool isCalibrationComplete(const CalibrationData &data)
    {
        return data.radius > 0.0 && data.center.x >= 0 && data.center.y >= 0;
    }

    Point2f normalizePoint(const Point2f &point, const Point2f &center, double radius)
    {
        if (radius <= 0.0)
        {
            return Point2f(0, 0);
        }
        return Point2f(static_cast<float>((point.x - center.x) / radius),
                       static_cast<float>((point.y - center.y) / radius));
    }

    double distanceFromCenter(const Point2f &point, const Point2f &center, double radius)
    {
        if (radius <= 0.0)
        {
            return 0.0;
        }
        return math::distanceToPoint(point, center) / radius;
    }

    CalibrationData setReferenceFrame(const CalibrationData &data, const string &data_url, int64_t timestamp_ms)
    {
        CalibrationData updated = data;
        updated.reference_frame = data_url;
        updated.timestamp = timestamp_ms;
        return updated;
    }

    int64_t currentTimestampMs()
    {
        return chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now().time_since_epoch()).count();
    }

} // namespace calibration
