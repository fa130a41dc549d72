#pragma once
#ifndef _CAMGEO_GEOMETRY_VALIDATE_HPP_
#define _CAMGEO_GEOMETRY_VALIDATE_HPP_

#include <opencv2/core.hpp>

#include <vector>

namespace camgeo {
namespace validate {

/**
 * @brief Intrinsic matrix with (0, 0, 1) as last row and finite values.
 */
bool cameraMatrix(const cv::Matx33d &K);

/**
 * @brief Finite values and determinant of +/-1.
 * @note Orthogonality is not checked.
 */
bool rotationMatrix(const cv::Matx33d &R);

/**
 * @brief Projection matrix with (0, 0, 1, 0) as last row and finite values.
 */
bool projectionMatrix(const cv::Matx34d &P);

/**
 * @brief Check if D contains valid distortion coefficients.
 * @param D    distortion coefficients (empty is valid: no distortion)
 * @param size resolution
 * @param K    intrinsic matrix for size
 * @note Tangential and prism distortion coefficients are not validated.
 *
 * Radial distortion is always monotonic for real lenses and distortion
 * function has to be bijective. This is verified by evaluating the distorted
 * radius over normalized radii from 0 to the image corner furthest from the
 * principal point, one sample per pixel of the image diagonal.
 *
 * Camera model documented in
 * https://docs.opencv.org/master/d9/d0c/group__calib3d.html#details
 */
bool distortionCoefficients(const std::vector<double> &D, cv::Size size, const cv::Matx33d &K);

}
}

#endif
