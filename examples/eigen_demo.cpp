#include <cmath>
#include <eigen3/Eigen/Core>
#include <iostream>
#include <psgraph/eigen.hpp>
#include <psgraph/psgraph.hpp>

using namespace psgraph;

int main()
{
    Logger::instance().add_sink(sinks::console_sink());

    Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(100, 0.0, 4.0 * M_PI);
    Eigen::MatrixXd y(100, 2);
    y.col(0) = x.array().sin().matrix();
    y.col(1) = (0.5 * x.array().cos()).matrix();

    ChartOptions opt;
    opt.paper.page.heading = "Eigen series";
    opt.style.line         = LineStyleOptions{};

    try
    {
        XYChart chart(opt);
        chart.build(xy_table(x, y, {"x", "sin", "half cos"}));
        return chart.write("eigen_demo.ps") ? 0 : 1;
    }
    catch (const Error& e)
    {
        std::cerr << "eigen_demo: " << e.what() << "\n";
        return 1;
    }
}
