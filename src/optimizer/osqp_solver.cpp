/**
 * @file osqp_solver.cpp
 * @brief Implementation of OSQP solver wrapper
 */

#include "sectoropt/optimizer/osqp_solver.hpp"
#include <cmath>
#include <memory>
#include <string>

namespace sectoropt
{
    namespace optimizer
    {

        namespace
        {
            struct OSQPWorkspaceDeleter
            {
                void operator()(::OSQPSolver *work) const
                {
                    if (work != nullptr)
                    {
                        osqp_cleanup(work);
                    }
                }
            };

            using OSQPWorkspace = std::unique_ptr<::OSQPSolver, OSQPWorkspaceDeleter>;

            Eigen::VectorXd copy_segment(const OSQPFloat *values, OSQPInt offset, Eigen::Index length)
            {
                Eigen::VectorXd out(length);
                for (Eigen::Index i = 0; i < length; ++i)
                {
                    out(i) = values[offset + i];
                }
                return out;
            }
        } // namespace

        OSQPSolver::OSQPSolver()
        {
        }

        OSQPSolver::OSQPSolver(const SolverOptions &options)
            : options_(options)
        {
        }

        void OSQPSolver::set_options(const SolverOptions &options)
        {
            options_ = options;
        }

        OSQPFloat OSQPSolver::to_osqp_bound(double value)
        {
            if (value >= OSQP_INFTY)
            {
                return OSQP_INFTY;
            }
            if (value <= -OSQP_INFTY)
            {
                return -OSQP_INFTY;
            }
            return static_cast<OSQPFloat>(value);
        }

        void OSQPSolver::convert_to_csc(
            const Eigen::MatrixXd &dense,
            std::vector<OSQPFloat> &data,
            std::vector<OSQPInt> &indices,
            std::vector<OSQPInt> &indptr,
            bool upper_triangular_only) const
        {
            const Eigen::Index rows = dense.rows();
            const Eigen::Index cols = dense.cols();

            data.clear();
            indices.clear();
            indptr.clear();
            indptr.reserve(static_cast<size_t>(cols + 1));

            indptr.push_back(0);

            for (Eigen::Index j = 0; j < cols; ++j)
            {
                const Eigen::Index row_limit = upper_triangular_only ? (j + 1) : rows;

                for (Eigen::Index i = 0; i < row_limit; ++i)
                {
                    const double val = dense(i, j);
                    // Keep the diagonal so P's structure never loses a column
                    if (std::abs(val) > 1e-14 || (upper_triangular_only && i == j))
                    {
                        data.push_back(val);
                        indices.push_back(static_cast<OSQPInt>(i));
                    }
                }
                indptr.push_back(static_cast<OSQPInt>(data.size()));
            }
        }

        OSQPInt OSQPSolver::build_constraint_matrix(
            const QuadraticProblem &problem,
            std::vector<OSQPFloat> &A_data,
            std::vector<OSQPInt> &A_indices,
            std::vector<OSQPInt> &A_indptr,
            std::vector<OSQPFloat> &l,
            std::vector<OSQPFloat> &u) const
        {
            const Eigen::Index n = problem.q.size();
            const Eigen::Index n_eq = problem.A_eq.rows();
            const Eigen::Index n_ineq = problem.A_ineq.rows();

            // Total rows: equality + inequality + one box row per variable
            const Eigen::Index m = n_eq + n_ineq + n;

            A_data.clear();
            A_indices.clear();
            A_indptr.clear();
            l.resize(static_cast<size_t>(m));
            u.resize(static_cast<size_t>(m));

            A_indptr.push_back(0);

            // Build constraint matrix column by column (CSC format)
            for (Eigen::Index j = 0; j < n; ++j)
            {
                for (Eigen::Index i = 0; i < n_eq; ++i)
                {
                    const double val = problem.A_eq(i, j);
                    if (std::abs(val) > 1e-14)
                    {
                        A_data.push_back(val);
                        A_indices.push_back(static_cast<OSQPInt>(i));
                    }
                }

                for (Eigen::Index i = 0; i < n_ineq; ++i)
                {
                    const double val = problem.A_ineq(i, j);
                    if (std::abs(val) > 1e-14)
                    {
                        A_data.push_back(val);
                        A_indices.push_back(static_cast<OSQPInt>(n_eq + i));
                    }
                }

                // Box row for x_j
                A_data.push_back(1.0);
                A_indices.push_back(static_cast<OSQPInt>(n_eq + n_ineq + j));

                A_indptr.push_back(static_cast<OSQPInt>(A_data.size()));
            }

            for (Eigen::Index i = 0; i < n_eq; ++i)
            {
                l[static_cast<size_t>(i)] = problem.b_eq(i);
                u[static_cast<size_t>(i)] = problem.b_eq(i);
            }

            for (Eigen::Index i = 0; i < n_ineq; ++i)
            {
                l[static_cast<size_t>(n_eq + i)] = to_osqp_bound(problem.b_ineq_lower(i));
                u[static_cast<size_t>(n_eq + i)] = to_osqp_bound(problem.b_ineq_upper(i));
            }

            for (Eigen::Index i = 0; i < n; ++i)
            {
                l[static_cast<size_t>(n_eq + n_ineq + i)] = to_osqp_bound(problem.lower_bounds(i));
                u[static_cast<size_t>(n_eq + n_ineq + i)] = to_osqp_bound(problem.upper_bounds(i));
            }

            return static_cast<OSQPInt>(m);
        }

        SolverResult OSQPSolver::solve(const QuadraticProblem &problem) const
        {
            problem.validate();

            SolverResult result;
            const Eigen::Index n = problem.q.size();
            const Eigen::Index n_eq = problem.A_eq.rows();
            const Eigen::Index n_ineq = problem.A_ineq.rows();

            // Convert P matrix to CSC format (upper triangle)
            std::vector<OSQPFloat> P_data;
            std::vector<OSQPInt> P_indices;
            std::vector<OSQPInt> P_indptr;
            convert_to_csc(problem.P, P_data, P_indices, P_indptr, true);

            std::vector<OSQPFloat> q(static_cast<size_t>(n));
            for (Eigen::Index i = 0; i < n; ++i)
            {
                q[static_cast<size_t>(i)] = problem.q(i);
            }

            std::vector<OSQPFloat> A_data;
            std::vector<OSQPInt> A_indices;
            std::vector<OSQPInt> A_indptr;
            std::vector<OSQPFloat> l;
            std::vector<OSQPFloat> u;

            const OSQPInt m = build_constraint_matrix(problem, A_data, A_indices, A_indptr, l, u);

            OSQPCscMatrix P_csc{};
            P_csc.m = static_cast<OSQPInt>(n);
            P_csc.n = static_cast<OSQPInt>(n);
            P_csc.p = P_indptr.data();
            P_csc.i = P_indices.data();
            P_csc.x = P_data.data();
            P_csc.nzmax = static_cast<OSQPInt>(P_data.size());
            P_csc.nz = -1; // -1 means CSC format (not triplet)

            OSQPCscMatrix A_csc{};
            A_csc.m = m;
            A_csc.n = static_cast<OSQPInt>(n);
            A_csc.p = A_indptr.data();
            A_csc.i = A_indices.data();
            A_csc.x = A_data.data();
            A_csc.nzmax = static_cast<OSQPInt>(A_data.size());
            A_csc.nz = -1;

            OSQPSettings settings;
            osqp_set_default_settings(&settings);
            settings.verbose = options_.verbose ? 1 : 0;
            settings.eps_abs = options_.tolerance;
            settings.eps_rel = options_.tolerance;
            settings.max_iter = options_.max_iterations;
            settings.polishing = options_.polish ? 1 : 0;

            ::OSQPSolver *raw_work = nullptr;
            const OSQPInt exit_flag = osqp_setup(&raw_work, &P_csc, q.data(), &A_csc,
                                                 l.data(), u.data(), m, static_cast<OSQPInt>(n), &settings);
            OSQPWorkspace work(raw_work);

            if (exit_flag != 0 || !work)
            {
                result.success = false;
                result.message = "OSQP setup failed (code " + std::to_string(exit_flag) + ")";
                return result;
            }

            osqp_solve(work.get());

            const OSQPInt status = work->info->status_val;
            result.iterations = static_cast<int>(work->info->iter);
            result.message = work->info->status;

            if (status != OSQP_SOLVED && status != OSQP_SOLVED_INACCURATE)
            {
                result.success = false;
                return result;
            }

            result.success = true;
            result.objective_value = work->info->obj_val;
            result.solution = copy_segment(work->solution->x, 0, n);
            result.duals_eq = copy_segment(work->solution->y, 0, n_eq);
            result.duals_ineq = copy_segment(work->solution->y, static_cast<OSQPInt>(n_eq), n_ineq);
            result.duals_box = copy_segment(work->solution->y, static_cast<OSQPInt>(n_eq + n_ineq), n);

            if (!result.solution.allFinite())
            {
                result.success = false;
                result.message = "OSQP returned a non-finite solution";
            }

            return result;
        }

    } // namespace optimizer
} // namespace sectoropt
