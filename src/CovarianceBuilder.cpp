#include "CovarianceBuilder.hpp"
#include "Exceptions.hpp"

namespace netgsa {

Eigen::MatrixXd centerRows(const Eigen::MatrixXd& data) {
    Eigen::MatrixXd centered = data;
    for (int i = 0; i < centered.rows(); ++i) {
        double mean = centered.row(i).mean();
        centered.row(i).array() -= mean;
    }
    return centered;
}

Eigen::MatrixXd buildCovariance(const Eigen::MatrixXd& data, double eta) {
    if (data.cols() < 2) {
        throw DimensionError("Covariance needs at least 2 samples, got data of shape "
                             + shapeString(data.rows(), data.cols()));
    }
    if (eta < 0) {
        throw std::invalid_argument("eta must be non-negative, got " + std::to_string(eta));
    }

    Eigen::MatrixXd centered = centerRows(data);
    Eigen::MatrixXd covariance = (centered * centered.transpose()) / (data.cols() - 1);
    covariance.diagonal().array() += eta;

    return covariance;
}

}
