#pragma once

#include <Eigen/Dense>

namespace netgsa {

// Subtract each gene's mean across samples
Eigen::MatrixXd centerRows(const Eigen::MatrixXd& data);

// Empirical covariance of a genes x samples matrix with `eta` added to the diagonal.
// Throws DimensionError when fewer than two samples are given.
Eigen::MatrixXd buildCovariance(const Eigen::MatrixXd& data, double eta = 0.0);

}
